#pragma once

#include "analysis/tables.hpp"

#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// classify — compare each observed value with its group's interval.
// Overdispersion is tested first and wins when both conditions hold, which
// can only happen with inverted bounds. NaN observations or bounds fail both
// comparisons and classify as NOT_SIGNIFICANT.
// ---------------------------------------------------------------------------
inline int classify_value(double observed, double lower, double upper) {
    if (observed > upper) return significance::OVERDISPERSED;
    if (observed < lower) return significance::CLUSTERED;
    return significance::NOT_SIGNIFICANT;
}

inline SignificanceTable classify(const MergedTable& merged) {
    SignificanceTable table;
    table.group_by = merged.group_by;
    table.units = merged.units;
    table.keys = merged.keys;
    table.metric_names = merged.metric_names;

    for (size_t m = 0; m < merged.metric_names.size(); ++m) {
        const auto& obs = merged.observed[m];
        const auto& expected = merged.expected[m];
        std::vector<int> col(merged.rows());
        for (size_t r = 0; r < merged.rows(); ++r) {
            col[r] = classify_value(obs[r], expected.ci_lower[r], expected.ci_upper[r]);
        }
        table.columns.push_back(std::move(col));
    }
    return table;
}

// Number of units per code, per metric
struct SignificanceCounts {
    int not_significant = 0;
    int clustered = 0;
    int overdispersed = 0;
};

inline std::map<std::string, SignificanceCounts> significance_counts(const SignificanceTable& table) {
    std::map<std::string, SignificanceCounts> counts;
    for (size_t m = 0; m < table.metric_names.size(); ++m) {
        auto& c = counts[table.metric_names[m]];
        for (int code : table.columns[m]) {
            if (code == significance::CLUSTERED) ++c.clustered;
            else if (code == significance::OVERDISPERSED) ++c.overdispersed;
            else ++c.not_significant;
        }
    }
    return counts;
}
