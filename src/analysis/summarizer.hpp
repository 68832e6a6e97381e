#pragma once

#include "analysis/statistical_tests.hpp"
#include "analysis/tables.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

constexpr double DEFAULT_CI_LEVEL = 0.95;

namespace detail {

// Grouping keys of every replicate row, plus the distinct keys in output
// order: ascending richness, or first-seen (placement) order for quadrats.
inline std::vector<std::string> row_keys(const ReplicateTable& replicates, GroupBy group_by,
                                         std::vector<std::string>& distinct) {
    std::vector<std::string> keys(replicates.rows());
    distinct.clear();

    if (group_by == GroupBy::QUADRAT) {
        std::map<std::string, bool> seen;
        for (size_t r = 0; r < replicates.rows(); ++r) {
            keys[r] = replicates.units[r];
            if (seen.emplace(keys[r], true).second) distinct.push_back(keys[r]);
        }
        return keys;
    }

    const auto& richness = replicates.column(RICHNESS);
    std::map<long, std::string> ordered;
    for (size_t r = 0; r < replicates.rows(); ++r) {
        keys[r] = group_key(GroupBy::RICHNESS, replicates.units[r], richness[r]);
        ordered.emplace(static_cast<long>(richness[r]), keys[r]);
    }
    for (const auto& [value, key] : ordered) distinct.push_back(key);
    return keys;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// summarize — per grouping key and per metric (richness excluded): mean,
// sample sd, and the two-sided interval mean +/- t * sd of the replicate
// distribution at `ci_level`. Non-finite scores are skipped; groups with
// fewer than two finite scores get NaN sd and bounds.
// ---------------------------------------------------------------------------
inline SummaryTable summarize(const ReplicateTable& replicates, GroupBy group_by,
                              double ci_level = DEFAULT_CI_LEVEL) {
    if (!(ci_level > 0.0 && ci_level < 1.0)) {
        throw std::invalid_argument("CI level must be in (0, 1), got " + std::to_string(ci_level));
    }

    SummaryTable summary;
    summary.group_by = group_by;
    auto keys = detail::row_keys(replicates, group_by, summary.keys);

    std::map<std::string, size_t> key_pos;
    for (size_t k = 0; k < summary.keys.size(); ++k) key_pos[summary.keys[k]] = k;

    for (size_t m = 0; m < replicates.metric_names.size(); ++m) {
        if (replicates.metric_names[m] == RICHNESS) continue;
        summary.metric_names.push_back(replicates.metric_names[m]);

        std::vector<std::vector<double>> groups(summary.keys.size());
        const auto& col = replicates.columns[m];
        for (size_t r = 0; r < replicates.rows(); ++r) {
            groups[key_pos[keys[r]]].push_back(col[r]);
        }

        MetricSummary stats;
        for (const auto& values : groups) {
            auto clean = finite_values(values);
            double mean = sample_mean(clean);
            double sd = sample_sd(clean);
            int n = static_cast<int>(clean.size());
            double half = detail::NaN;
            if (!std::isnan(sd)) {
                half = detail::student_t_quantile((1.0 + ci_level) / 2.0, n - 1.0) * sd;
            }
            stats.mean.push_back(mean);
            stats.sd.push_back(sd);
            stats.ci_lower.push_back(mean - half);
            stats.ci_upper.push_back(mean + half);
            stats.n.push_back(n);
        }
        summary.stats.push_back(std::move(stats));
    }
    return summary;
}
