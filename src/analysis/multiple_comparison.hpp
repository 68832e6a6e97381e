#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

// Holm-Bonferroni step-down correction for multiple comparisons.
// Returns corrected p-values in the SAME order as input. NaN p-values are
// left as NaN and do not count towards the number of tests.
inline std::vector<double> holm_bonferroni_correct(const std::vector<double>& raw_pvals) {
    std::vector<double> corrected = raw_pvals;

    std::vector<size_t> order;
    for (size_t i = 0; i < raw_pvals.size(); ++i) {
        if (!std::isnan(raw_pvals[i])) order.push_back(i);
    }
    size_t m = order.size();
    if (m < 2) return corrected;

    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return raw_pvals[a] < raw_pvals[b];
    });

    double running_max = 0.0;
    for (size_t rank = 0; rank < m; ++rank) {
        size_t idx = order[rank];
        double adjusted = std::min(raw_pvals[idx] * static_cast<double>(m - rank), 1.0);
        // Corrected p-values must be non-decreasing in sorted order
        running_max = std::max(running_max, adjusted);
        corrected[idx] = running_max;
    }
    return corrected;
}
