#pragma once

#include "analysis/statistical_tests.hpp"
#include "analysis/tables.hpp"
#include "errors.hpp"

#include <cmath>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// merge_observed — align every observed row with exactly one summary row on
// the summary's grouping key. Fails on the first row without a match.
// ---------------------------------------------------------------------------
inline MergedTable merge_observed(const MetricTable& observed, const SummaryTable& summary) {
    MergedTable merged;
    merged.group_by = summary.group_by;
    merged.units = observed.units;
    merged.metric_names = summary.metric_names;

    const auto& richness = observed.column(RICHNESS);
    std::vector<size_t> summary_row(observed.rows());
    for (size_t r = 0; r < observed.rows(); ++r) {
        std::string key = group_key(summary.group_by, observed.units[r], richness[r]);
        int idx = summary.key_index(key);
        if (idx < 0) throw UnmatchedGroupingKey(key, observed.units[r]);
        merged.keys.push_back(key);
        summary_row[r] = static_cast<size_t>(idx);
    }

    for (size_t m = 0; m < summary.metric_names.size(); ++m) {
        merged.observed.push_back(observed.column(summary.metric_names[m]));

        const auto& stats = summary.stats[m];
        MetricSummary aligned;
        for (size_t r = 0; r < observed.rows(); ++r) {
            size_t s = summary_row[r];
            aligned.mean.push_back(stats.mean[s]);
            aligned.sd.push_back(stats.sd[s]);
            aligned.ci_lower.push_back(stats.ci_lower[s]);
            aligned.ci_upper.push_back(stats.ci_upper[s]);
            aligned.n.push_back(stats.n[s]);
        }
        merged.expected.push_back(std::move(aligned));
    }
    return merged;
}

// Mean of the non-zero finite sds of one metric, one value per distinct
// group in the merged table. NaN when no group has a usable sd.
inline double substitute_sd(const MergedTable& merged, size_t metric) {
    std::map<std::string, double> per_group;
    const auto& sd = merged.expected[metric].sd;
    for (size_t r = 0; r < merged.rows(); ++r) per_group.emplace(merged.keys[r], sd[r]);

    std::vector<double> usable;
    for (const auto& [key, value] : per_group) {
        if (std::isfinite(value) && value != 0.0) usable.push_back(value);
    }
    return sample_mean(usable);
}

// ---------------------------------------------------------------------------
// standardize — (observed - mean) / sd per metric. Zero sds are replaced by
// substitute_sd; NaN sds stay NaN and give NaN effect sizes.
// ---------------------------------------------------------------------------
inline SESTable standardize(const MergedTable& merged) {
    SESTable ses;
    ses.group_by = merged.group_by;
    ses.units = merged.units;
    ses.keys = merged.keys;
    ses.metric_names = merged.metric_names;

    for (size_t m = 0; m < merged.metric_names.size(); ++m) {
        const auto& obs = merged.observed[m];
        const auto& expected = merged.expected[m];
        double fallback = substitute_sd(merged, m);

        std::vector<double> col(merged.rows());
        for (size_t r = 0; r < merged.rows(); ++r) {
            double sd = expected.sd[r];
            if (sd == 0.0) sd = fallback;
            col[r] = (obs[r] - expected.mean[r]) / sd;
        }
        ses.columns.push_back(std::move(col));
    }
    return ses;
}
