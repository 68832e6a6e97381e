#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Name of the baseline metric every metric table starts with.
inline const std::string RICHNESS = "richness";

// ---------------------------------------------------------------------------
// GroupBy — how randomized scores are pooled before comparison.
//   RICHNESS: an observed unit is compared with every randomized unit of the
//             same richness.
//   QUADRAT:  an observed unit is compared with the same unit across
//             replicates.
// ---------------------------------------------------------------------------
enum class GroupBy { RICHNESS, QUADRAT };

inline std::string group_by_name(GroupBy g) {
    return (g == GroupBy::RICHNESS) ? "richness" : "quadrat";
}

inline bool parse_group_by(const std::string& s, GroupBy& out) {
    if (s == "richness") { out = GroupBy::RICHNESS; return true; }
    if (s == "quadrat")  { out = GroupBy::QUADRAT;  return true; }
    return false;
}

inline std::string group_key(GroupBy g, const std::string& unit, double richness) {
    if (g == GroupBy::QUADRAT) return unit;
    return std::to_string(static_cast<long>(richness));
}

namespace table_detail {

inline int find_name(const std::vector<std::string>& names, const std::string& name) {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return static_cast<int>(i);
    }
    return -1;
}

inline size_t require_name(const std::vector<std::string>& names, const std::string& name) {
    int idx = find_name(names, name);
    if (idx < 0) throw std::out_of_range("No column named '" + name + "'");
    return static_cast<size_t>(idx);
}

}  // namespace table_detail

// ---------------------------------------------------------------------------
// MetricTable — one row per unit, one column per metric (richness first)
// ---------------------------------------------------------------------------
struct MetricTable {
    std::vector<std::string> units;
    std::vector<std::string> metric_names;
    std::vector<std::vector<double>> columns;   // columns[metric][row]

    size_t rows() const { return units.size(); }

    int metric_index(const std::string& name) const {
        return table_detail::find_name(metric_names, name);
    }

    const std::vector<double>& column(const std::string& name) const {
        return columns[table_detail::require_name(metric_names, name)];
    }
};

// ---------------------------------------------------------------------------
// ReplicateTable — long-format record of one null model's randomizations,
// keyed by (replicate, unit). Built once by the randomization engine.
// ---------------------------------------------------------------------------
struct ReplicateTable {
    std::string null_name;
    std::vector<std::string> metric_names;
    std::vector<int> replicate;
    std::vector<std::string> units;
    std::vector<std::vector<double>> columns;   // columns[metric][row]

    size_t rows() const { return units.size(); }

    int replicate_count() const {
        int count = 0;
        for (int r : replicate) count = std::max(count, r + 1);
        return count;
    }

    const std::vector<double>& column(const std::string& name) const {
        return columns[table_detail::require_name(metric_names, name)];
    }
};

// ---------------------------------------------------------------------------
// MetricSummary — per-group distribution summary of one metric
// ---------------------------------------------------------------------------
struct MetricSummary {
    std::vector<double> mean;
    std::vector<double> sd;
    std::vector<double> ci_lower;
    std::vector<double> ci_upper;
    std::vector<int> n;
};

// ---------------------------------------------------------------------------
// SummaryTable — one row per grouping key; richness is never summarized
// ---------------------------------------------------------------------------
struct SummaryTable {
    GroupBy group_by = GroupBy::RICHNESS;
    std::vector<std::string> keys;
    std::vector<std::string> metric_names;
    std::vector<MetricSummary> stats;           // stats[metric].mean[key]

    int key_index(const std::string& key) const {
        return table_detail::find_name(keys, key);
    }

    const MetricSummary& metric(const std::string& name) const {
        return stats[table_detail::require_name(metric_names, name)];
    }
};

// ---------------------------------------------------------------------------
// MergedTable — observed rows aligned with their summary row
// ---------------------------------------------------------------------------
struct MergedTable {
    GroupBy group_by = GroupBy::RICHNESS;
    std::vector<std::string> units;
    std::vector<std::string> keys;
    std::vector<std::string> metric_names;
    std::vector<std::vector<double>> observed;  // observed[metric][row]
    std::vector<MetricSummary> expected;        // expected[metric].mean[row]

    size_t rows() const { return units.size(); }
};

// ---------------------------------------------------------------------------
// SESTable — standardized effect sizes, one column per metric
// ---------------------------------------------------------------------------
struct SESTable {
    GroupBy group_by = GroupBy::RICHNESS;
    std::vector<std::string> units;
    std::vector<std::string> keys;
    std::vector<std::string> metric_names;
    std::vector<std::vector<double>> columns;   // columns[metric][row]

    size_t rows() const { return units.size(); }

    const std::vector<double>& column(const std::string& name) const {
        return columns[table_detail::require_name(metric_names, name)];
    }
};

namespace significance {
    constexpr int NOT_SIGNIFICANT = 0;
    constexpr int CLUSTERED       = 1;
    constexpr int OVERDISPERSED   = 2;
}  // namespace significance

// ---------------------------------------------------------------------------
// SignificanceTable — significance codes, one column per metric
// ---------------------------------------------------------------------------
struct SignificanceTable {
    GroupBy group_by = GroupBy::RICHNESS;
    std::vector<std::string> units;
    std::vector<std::string> keys;
    std::vector<std::string> metric_names;
    std::vector<std::vector<int>> columns;      // columns[metric][row]

    size_t rows() const { return units.size(); }

    const std::vector<int>& column(const std::string& name) const {
        return columns[table_detail::require_name(metric_names, name)];
    }
};
