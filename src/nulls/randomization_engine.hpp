#pragma once

#include "analysis/tables.hpp"
#include "metrics/metric_registry.hpp"
#include "metrics/metric_runner.hpp"
#include "nulls/null_registry.hpp"
#include "nulls/nulls_input.hpp"

#include <algorithm>
#include <cstdint>
#include <future>
#include <map>
#include <random>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// EngineConfig
// ---------------------------------------------------------------------------
struct EngineConfig {
    uint32_t seed = 42;
    int n_threads = 1;   // concurrent null models
};

namespace detail {

// Score every randomized CDM of one null model into a long-format table.
// A null model may return any number of CDMs, including none.
inline ReplicateTable score_null(const NullsInput& input, const NamedNull& null,
                                 const MetricRegistry& metrics, uint32_t seed) {
    std::mt19937 rng(seed);
    auto randomized = null.fn(input, rng);

    ReplicateTable table;
    table.null_name = null.name;
    table.metric_names = metrics.names();
    table.columns.assign(metrics.size(), {});
    for (size_t rep = 0; rep < randomized.size(); ++rep) {
        auto scored = run_metrics(input.metrics().with_cdm(std::move(randomized[rep])), metrics);
        for (size_t row = 0; row < scored.rows(); ++row) {
            table.replicate.push_back(static_cast<int>(rep));
            table.units.push_back(scored.units[row]);
        }
        for (size_t m = 0; m < metrics.size(); ++m) {
            auto& col = table.columns[m];
            col.insert(col.end(), scored.columns[m].begin(), scored.columns[m].end());
        }
    }
    return table;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// run_nulls — run every null model and score its randomizations with every
// metric.
//
// Each null model gets its own generator, seeded from a master generator in
// registry order, so output does not depend on n_threads. Up to n_threads
// models run at once; results are committed after all tasks have finished
// and the first failure is rethrown.
// ---------------------------------------------------------------------------
inline std::map<std::string, ReplicateTable> run_nulls(const NullsInput& input,
                                                       const NullRegistry& nulls,
                                                       const MetricRegistry& metrics,
                                                       const EngineConfig& config = {}) {
    std::mt19937 master(config.seed);
    std::vector<uint32_t> seeds;
    seeds.reserve(nulls.size());
    for (size_t i = 0; i < nulls.size(); ++i) seeds.push_back(master());

    const auto& entries = nulls.entries();
    size_t batch = static_cast<size_t>(std::max(1, config.n_threads));
    std::vector<ReplicateTable> tables;
    tables.reserve(entries.size());

    for (size_t start = 0; start < entries.size(); start += batch) {
        size_t end = std::min(start + batch, entries.size());
        std::vector<std::future<ReplicateTable>> futures;
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, [&, i]() {
                return detail::score_null(input, entries[i], metrics, seeds[i]);
            }));
        }
        for (auto& f : futures) tables.push_back(f.get());
    }

    std::map<std::string, ReplicateTable> out;
    for (auto& t : tables) {
        std::string name = t.null_name;
        out.emplace(std::move(name), std::move(t));
    }
    return out;
}

struct MetricsAndNulls {
    MetricTable observed;
    std::map<std::string, ReplicateTable> randomized;
};

// Observed metrics plus every null model in one call.
inline MetricsAndNulls metrics_n_nulls(const NullsInput& input,
                                       const NullRegistry& nulls,
                                       const MetricRegistry& metrics,
                                       const EngineConfig& config = {}) {
    MetricsAndNulls out;
    out.observed = run_metrics(input.metrics(), metrics);
    out.randomized = run_nulls(input, nulls, metrics, config);
    return out;
}
