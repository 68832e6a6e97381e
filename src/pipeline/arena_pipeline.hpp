#pragma once

#include "analysis/robust_test.hpp"
#include "analysis/ses.hpp"
#include "analysis/significance.hpp"
#include "analysis/summarizer.hpp"
#include "analysis/tables.hpp"
#include "community/community_matrix.hpp"
#include "community/phylo_tree.hpp"
#include "metrics/metric_registry.hpp"
#include "metrics/metric_runner.hpp"
#include "nulls/null_registry.hpp"
#include "nulls/nulls_input.hpp"
#include "nulls/randomization_engine.hpp"
#include "spatial/quadrat_contents.hpp"

#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PipelineConfig
// ---------------------------------------------------------------------------
struct PipelineConfig {
    std::vector<std::string> metrics;   // empty = full catalogue
    std::vector<std::string> nulls;     // empty = full catalogue
    int randomizations = DEFAULT_RANDOMIZATIONS;
    int swap_iterations = DEFAULT_SWAP_ITERATIONS;
    EngineConfig engine;
    GroupBy group_by = GroupBy::QUADRAT;
    double ci_level = DEFAULT_CI_LEVEL;
    Alternative alternative = Alternative::TWO_SIDED;
};

// Everything derived from one null model
struct NullReport {
    SummaryTable summary;
    SESTable ses;
    SignificanceTable significance;
    std::map<std::string, SignificanceCounts> counts;
    std::vector<RobustTestResult> wilcoxon;
};

struct PipelineResult {
    CommunityMatrix cdm;
    std::vector<QuadratBounds> bounds;   // empty when the CDM was supplied
    bool regional_derived = false;
    MetricTable observed;
    std::map<std::string, NullReport> nulls;
};

// Summary, SES, significance and signed-rank tests for one null model.
inline NullReport report_null(const MetricTable& observed, const ReplicateTable& replicates,
                              const PipelineConfig& config) {
    NullReport report;
    report.summary = summarize(replicates, config.group_by, config.ci_level);
    auto merged = merge_observed(observed, report.summary);
    report.ses = standardize(merged);
    report.significance = classify(merged);
    report.counts = significance_counts(report.significance);
    report.wilcoxon = robust_test(report.ses, config.alternative);
    return report;
}

// ---------------------------------------------------------------------------
// run_pipeline — observed metrics, every null model, and the per-null
// reports for a ready-made CDM.
// ---------------------------------------------------------------------------
inline PipelineResult run_pipeline(const PhyloTree& tree, const CommunityMatrix& cdm,
                                   const std::optional<std::vector<std::string>>& regional,
                                   const PipelineConfig& config) {
    auto metric_registry = check_metrics(config.metrics);
    auto null_registry = check_nulls(config.nulls);
    auto input = prep_nulls(tree, cdm, regional, config.randomizations, config.swap_iterations);

    PipelineResult result;
    result.cdm = cdm;
    result.regional_derived = input.regional_derived();

    auto scored = metrics_n_nulls(input, null_registry, metric_registry, config.engine);
    result.observed = std::move(scored.observed);
    for (const auto& [name, replicates] : scored.randomized) {
        result.nulls.emplace(name, report_null(result.observed, replicates, config));
    }
    return result;
}

// Sample `quadrats` quadrats from the arena, then run the CDM pipeline.
// Placement uses its own generator seeded from the engine seed.
inline PipelineResult run_arena_pipeline(const PhyloTree& tree, const Arena& arena,
                                         int quadrats, int quadrat_length,
                                         const PipelineConfig& config) {
    std::mt19937 rng(config.engine.seed);
    auto sampled = make_cdm(arena, quadrats, quadrat_length, rng);

    std::optional<std::vector<std::string>> regional;
    if (!sampled.regional_derived) regional = sampled.regional_abundance;

    auto result = run_pipeline(tree, sampled.cdm, regional, config);
    result.bounds = std::move(sampled.bounds);
    return result;
}
