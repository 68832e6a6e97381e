// statistical_tests_test.cpp — Tests for the signed-rank test, t quantiles
// and Holm-Bonferroni correction

#include <gtest/gtest.h>

#include "analysis/multiple_comparison.hpp"
#include "analysis/statistical_tests.hpp"

#include <cmath>
#include <string>
#include <vector>

// ===========================================================================
// Descriptive helpers
// ===========================================================================

class DescriptiveTest : public ::testing::Test {};

TEST_F(DescriptiveTest, MeanAndSdSkipNonFiniteValues) {
    std::vector<double> data = {1.0, NAN, 3.0, INFINITY, 5.0};
    EXPECT_EQ(finite_values(data).size(), 3u);
    EXPECT_DOUBLE_EQ(sample_mean(data), 3.0);
    EXPECT_DOUBLE_EQ(sample_sd(data), 2.0);
}

TEST_F(DescriptiveTest, TooFewValuesGiveNaN) {
    EXPECT_TRUE(std::isnan(sample_mean({})));
    EXPECT_TRUE(std::isnan(sample_sd({4.0})));
    EXPECT_TRUE(std::isnan(sample_mean({NAN, NAN})));
}

// ===========================================================================
// Quantiles
// ===========================================================================

class QuantileTest : public ::testing::Test {};

TEST_F(QuantileTest, NormalQuantile) {
    EXPECT_NEAR(detail::normal_quantile(0.975), 1.959964, 1e-6);
    EXPECT_NEAR(detail::normal_quantile(0.5), 0.0, 1e-9);
    EXPECT_NEAR(detail::normal_quantile(0.01), -2.326348, 1e-6);
}

TEST_F(QuantileTest, StudentTExactForOneAndTwoDf) {
    EXPECT_NEAR(detail::student_t_quantile(0.975, 1.0), 12.7062047, 1e-6);
    EXPECT_NEAR(detail::student_t_quantile(0.975, 2.0), 4.3026527, 1e-6);
}

TEST_F(QuantileTest, StudentTAccurateForSmallDf) {
    EXPECT_NEAR(detail::student_t_quantile(0.975, 3.0), 3.1824463, 1e-6);
    EXPECT_NEAR(detail::student_t_quantile(0.975, 4.0), 2.7764451, 1e-6);
    EXPECT_NEAR(detail::student_t_quantile(0.975, 5.0), 2.5705818, 1e-6);
    EXPECT_NEAR(detail::student_t_quantile(0.995, 3.0), 5.8409093, 1e-6);
}

TEST_F(QuantileTest, StudentTForLargerDf) {
    EXPECT_NEAR(detail::student_t_quantile(0.975, 10.0), 2.2281389, 1e-6);
    EXPECT_NEAR(detail::student_t_quantile(0.975, 99.0), 1.9842170, 1e-6);
    EXPECT_NEAR(detail::student_t_quantile(0.95, 30.0), 1.6972609, 1e-6);
}

TEST_F(QuantileTest, StudentTCdfInvertsTheQuantile) {
    EXPECT_DOUBLE_EQ(detail::student_t_cdf(0.0, 7.0), 0.5);
    EXPECT_NEAR(detail::student_t_cdf(2.2281389, 10.0), 0.975, 1e-8);
    EXPECT_NEAR(detail::student_t_cdf(-3.1824463, 3.0), 0.025, 1e-8);
    // df = 1 is the Cauchy distribution
    EXPECT_NEAR(detail::student_t_cdf(1.0, 1.0), 0.75, 1e-12);
}

TEST_F(QuantileTest, StudentTIsSymmetric) {
    EXPECT_NEAR(detail::student_t_quantile(0.025, 12.0),
                -detail::student_t_quantile(0.975, 12.0), 1e-9);
}

TEST_F(QuantileTest, StudentTRejectsNonPositiveDf) {
    EXPECT_TRUE(std::isnan(detail::student_t_quantile(0.975, 0.0)));
    EXPECT_TRUE(std::isnan(detail::student_t_quantile(0.975, -1.0)));
}

// ===========================================================================
// Wilcoxon signed-rank
// ===========================================================================

class WilcoxonTest : public ::testing::Test {};

TEST_F(WilcoxonTest, ExactAllPositive) {
    auto r = wilcoxon_signed_rank({1.0, 2.0, 3.0, 4.0, 5.0});
    EXPECT_TRUE(r.exact);
    EXPECT_DOUBLE_EQ(r.statistic, 15.0);
    EXPECT_EQ(r.n, 5);
    EXPECT_NEAR(r.p_value, 0.0625, 1e-12);
}

TEST_F(WilcoxonTest, ExactOneSided) {
    std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_NEAR(wilcoxon_signed_rank(data, 0.0, Alternative::GREATER).p_value, 1.0 / 32.0, 1e-12);
    EXPECT_NEAR(wilcoxon_signed_rank(data, 0.0, Alternative::LESS).p_value, 1.0, 1e-12);
}

TEST_F(WilcoxonTest, ExactMixedSigns) {
    auto r = wilcoxon_signed_rank({-1.0, 2.0, 3.0, 4.0, 5.0});
    EXPECT_DOUBLE_EQ(r.statistic, 14.0);
    EXPECT_NEAR(r.p_value, 0.125, 1e-12);
}

TEST_F(WilcoxonTest, LocationShiftIsApplied) {
    auto r = wilcoxon_signed_rank({11.0, 12.0, 13.0, 14.0, 15.0}, 10.0);
    EXPECT_DOUBLE_EQ(r.statistic, 15.0);
    EXPECT_NEAR(r.p_value, 0.0625, 1e-12);
}

TEST_F(WilcoxonTest, TiesUseNormalApproximation) {
    // All ranks tied at 2.5: V = 10, sigma = 2.5, z = (5 - 0.5) / 2.5
    auto r = wilcoxon_signed_rank({1.0, 1.0, 1.0, 1.0});
    EXPECT_FALSE(r.exact);
    EXPECT_DOUBLE_EQ(r.statistic, 10.0);
    EXPECT_NEAR(r.p_value, 0.0718606, 1e-6);
}

TEST_F(WilcoxonTest, ZerosAreDroppedAndForceNormalApproximation) {
    auto r = wilcoxon_signed_rank({0.0, 1.0, 2.0, 3.0});
    EXPECT_FALSE(r.exact);
    EXPECT_EQ(r.n, 3);
    EXPECT_DOUBLE_EQ(r.statistic, 6.0);
}

TEST_F(WilcoxonTest, AllZeroDifferencesGivePOne) {
    auto r = wilcoxon_signed_rank({0.0, 0.0, 0.0});
    EXPECT_EQ(r.n, 0);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
}

TEST_F(WilcoxonTest, NoFiniteValuesGiveNaN) {
    auto r = wilcoxon_signed_rank({NAN, NAN});
    EXPECT_TRUE(std::isnan(r.p_value));
    EXPECT_TRUE(std::isnan(wilcoxon_signed_rank({}).p_value));
}

TEST_F(WilcoxonTest, NaNEntriesAreIgnored) {
    auto with_nan = wilcoxon_signed_rank({1.0, NAN, 2.0, 3.0, 4.0, 5.0});
    EXPECT_NEAR(with_nan.p_value, 0.0625, 1e-12);
}

TEST_F(WilcoxonTest, LargeSampleUsesNormalApproximation) {
    std::vector<double> data;
    for (int i = 1; i <= 60; ++i) data.push_back(i % 2 == 0 ? i : -i);
    auto r = wilcoxon_signed_rank(data);
    EXPECT_FALSE(r.exact);
    EXPECT_GT(r.p_value, 0.5);
}

// ===========================================================================
// Alternative names
// ===========================================================================

TEST(AlternativeTest, ParsesAcceptedSpellings) {
    Alternative a = Alternative::TWO_SIDED;
    EXPECT_TRUE(parse_alternative("greater", a));
    EXPECT_EQ(a, Alternative::GREATER);
    EXPECT_TRUE(parse_alternative("less", a));
    EXPECT_EQ(a, Alternative::LESS);
    EXPECT_TRUE(parse_alternative("two-sided", a));
    EXPECT_EQ(a, Alternative::TWO_SIDED);
    EXPECT_FALSE(parse_alternative("sideways", a));
    EXPECT_EQ(alternative_name(Alternative::TWO_SIDED), "two.sided");
}

// ===========================================================================
// Holm-Bonferroni
// ===========================================================================

class HolmBonferroniTest : public ::testing::Test {};

TEST_F(HolmBonferroniTest, StepDownKeepsInputOrder) {
    auto corrected = holm_bonferroni_correct({0.01, 0.04, 0.03});
    ASSERT_EQ(corrected.size(), 3u);
    EXPECT_NEAR(corrected[0], 0.03, 1e-12);
    EXPECT_NEAR(corrected[1], 0.06, 1e-12);
    EXPECT_NEAR(corrected[2], 0.06, 1e-12);
}

TEST_F(HolmBonferroniTest, CorrectedNeverBelowRaw) {
    std::vector<double> raw = {0.2, 0.001, 0.05, 0.9, 0.01};
    auto corrected = holm_bonferroni_correct(raw);
    for (size_t i = 0; i < raw.size(); ++i) {
        EXPECT_GE(corrected[i], raw[i]);
        EXPECT_LE(corrected[i], 1.0);
    }
}

TEST_F(HolmBonferroniTest, ClampsAtOne) {
    auto corrected = holm_bonferroni_correct({0.5, 0.6});
    EXPECT_DOUBLE_EQ(corrected[0], 1.0);
    EXPECT_DOUBLE_EQ(corrected[1], 1.0);
}

TEST_F(HolmBonferroniTest, NaNIsSkippedAndNotCounted) {
    auto corrected = holm_bonferroni_correct({0.01, NAN, 0.04});
    EXPECT_NEAR(corrected[0], 0.02, 1e-12);
    EXPECT_TRUE(std::isnan(corrected[1]));
    EXPECT_NEAR(corrected[2], 0.04, 1e-12);
}

TEST_F(HolmBonferroniTest, SingleTestIsUnchanged) {
    EXPECT_EQ(holm_bonferroni_correct({0.03}), (std::vector<double>{0.03}));
    EXPECT_TRUE(holm_bonferroni_correct({}).empty());
}
