// metric_runner_test.cpp — Tests for prep_metrics, the metric catalogue and run_metrics

#include <gtest/gtest.h>

#include "errors.hpp"
#include "metrics/metric_runner.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using test_helpers::four_tip_tree;
using test_helpers::four_unit_cdm;

// ===========================================================================
// prep_metrics
// ===========================================================================

class PrepMetricsTest : public ::testing::Test {};

TEST_F(PrepMetricsTest, CachesMatricesInCdmColumnOrder) {
    CommunityMatrix cdm({"q1"}, {"C", "A"}, {{1, 1}});
    auto input = prep_metrics(four_tip_tree(), cdm);
    ASSERT_EQ(input.distances().size(), 2u);
    EXPECT_DOUBLE_EQ(input.distances()[0][1], 4.0);
    EXPECT_DOUBLE_EQ(input.correlation()[0][0], 1.0);
    EXPECT_EQ(input.tree().tip_count(), 2u);
}

TEST_F(PrepMetricsTest, SpeciesMissingFromTreeThrows) {
    CommunityMatrix cdm({"q1"}, {"A", "Z"}, {{1, 1}});
    EXPECT_THROW(prep_metrics(four_tip_tree(), cdm), InvalidInputType);
}

TEST_F(PrepMetricsTest, WithCdmRequiresSameColumns) {
    auto input = prep_metrics(four_tip_tree(), four_unit_cdm());
    CommunityMatrix other({"q1"}, {"A", "B", "C"}, {{1, 1, 1}});
    EXPECT_THROW(input.with_cdm(other), InvalidInputType);

    auto same = input.with_cdm(four_unit_cdm().presence_absence());
    EXPECT_DOUBLE_EQ(same.cdm().at(0, 1), 1.0);
    EXPECT_EQ(&same.distances(), &input.distances());
}

// ===========================================================================
// Catalogue values on the four-tip fixture
// ===========================================================================

class MetricCatalogueTest : public ::testing::Test {
protected:
    MetricsInput input = prep_metrics(four_tip_tree(), four_unit_cdm());
};

TEST_F(MetricCatalogueTest, Richness) {
    auto v = metric_catalogue::richness(input);
    EXPECT_EQ(v, (std::vector<double>{2, 2, 4, 1}));
}

TEST_F(MetricCatalogueTest, FaithPd) {
    auto v = metric_catalogue::pd(input);
    EXPECT_DOUBLE_EQ(v[0], 3.0);
    EXPECT_DOUBLE_EQ(v[1], 3.0);
    EXPECT_DOUBLE_EQ(v[2], 6.0);
    EXPECT_DOUBLE_EQ(v[3], 2.0);
}

TEST_F(MetricCatalogueTest, MeanPairwiseDistance) {
    auto v = metric_catalogue::mpd(input);
    EXPECT_DOUBLE_EQ(v[0], 2.0);
    EXPECT_DOUBLE_EQ(v[1], 2.0);
    EXPECT_NEAR(v[2], 20.0 / 6.0, 1e-12);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(MetricCatalogueTest, AbundanceWeightedMpdIncludesDiagonalWeights) {
    auto v = metric_catalogue::mpd_abundance(input);
    // quadrat1: A=1, B=2 -> 2 * (1 * 2 * 2) / (1 + 2)^2
    EXPECT_NEAR(v[0], 8.0 / 9.0, 1e-12);
    // quadrat2: C=3, D=1 -> 2 * (3 * 1 * 2) / 16
    EXPECT_NEAR(v[1], 0.75, 1e-12);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(MetricCatalogueTest, MeanNearestTaxonDistance) {
    auto v = metric_catalogue::mntd(input);
    EXPECT_DOUBLE_EQ(v[0], 2.0);
    EXPECT_DOUBLE_EQ(v[2], 2.0);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(MetricCatalogueTest, PhylogeneticSpeciesVariability) {
    auto v = metric_catalogue::psv(input);
    EXPECT_NEAR(v[0], 0.5, 1e-12);
    EXPECT_NEAR(v[2], 10.0 / 12.0, 1e-12);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(MetricCatalogueTest, CorrectedPhylogeneticSpeciesClustering) {
    auto v = metric_catalogue::psc(input);
    EXPECT_NEAR(v[0], 0.5, 1e-12);
    EXPECT_NEAR(v[2], 0.5, 1e-12);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(MetricCatalogueTest, EmptyUnitGivesNaNPd) {
    CommunityMatrix cdm({"q1", "q2"}, {"A", "B"}, {{1, 1}, {0, 0}});
    auto in = prep_metrics(four_tip_tree(), cdm);
    auto v = metric_catalogue::pd(in);
    EXPECT_FALSE(std::isnan(v[0]));
    EXPECT_TRUE(std::isnan(v[1]));
}

// ===========================================================================
// run_metrics
// ===========================================================================

class RunMetricsTest : public ::testing::Test {};

TEST_F(RunMetricsTest, RichnessColumnComesFirstAndRowsFollowCdm) {
    CommunityMatrix cdm({"q1", "q2"}, {"A", "B", "C"}, {{1, 0, 2}, {0, 0, 0}});
    auto table = run_metrics(prep_metrics(four_tip_tree(), cdm), check_metrics({}));

    ASSERT_FALSE(table.metric_names.empty());
    EXPECT_EQ(table.metric_names.front(), "richness");
    EXPECT_EQ(table.units, (std::vector<std::string>{"q1", "q2"}));
    EXPECT_EQ(table.column("richness"), (std::vector<double>{2, 0}));
}

TEST_F(RunMetricsTest, OneColumnPerRegistryEntry) {
    auto table = calc_metrics(four_tip_tree(), four_unit_cdm(), check_metrics({"mpd", "pd"}));
    EXPECT_EQ(table.metric_names, (std::vector<std::string>{"richness", "mpd", "pd"}));
    ASSERT_EQ(table.columns.size(), 3u);
    for (const auto& col : table.columns) EXPECT_EQ(col.size(), 4u);
}

TEST_F(RunMetricsTest, WrongLengthMetricIsALogicError) {
    auto registry = MetricRegistry::from_functions(
        {{"broken", [](const MetricsInput&) { return std::vector<double>{1.0}; }}});
    EXPECT_THROW(run_metrics(prep_metrics(four_tip_tree(), four_unit_cdm()), registry),
                 std::logic_error);
}

TEST_F(RunMetricsTest, CustomMetricSeesThePreparedInput) {
    auto registry = MetricRegistry::from_functions(
        {{"species", [](const MetricsInput& in) {
              return std::vector<double>(in.cdm().rows(), static_cast<double>(in.cdm().cols()));
          }}});
    auto table = calc_metrics(four_tip_tree(), four_unit_cdm(), registry);
    EXPECT_EQ(table.column("species"), (std::vector<double>{4, 4, 4, 4}));
}
