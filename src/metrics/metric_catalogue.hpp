#pragma once

#include "metrics/metrics_input.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Built-in community metrics. Each returns one value per CDM row and NaN
// where the metric is undefined for that row.
// ---------------------------------------------------------------------------
namespace metric_catalogue {

namespace detail {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

inline std::vector<double> richness(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    std::vector<double> out(cdm.rows());
    for (size_t r = 0; r < cdm.rows(); ++r) out[r] = static_cast<double>(cdm.richness(r));
    return out;
}

// Faith's PD. Includes the path to the root; NaN for empty units.
inline std::vector<double> pd(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    std::vector<double> out(cdm.rows(), detail::NaN);
    for (size_t r = 0; r < cdm.rows(); ++r) {
        auto idx = cdm.present(r);
        if (idx.empty()) continue;
        std::vector<std::string> labels;
        labels.reserve(idx.size());
        for (size_t c : idx) labels.push_back(cdm.col_names()[c]);
        out[r] = in.tree().pd(labels);
    }
    return out;
}

// Mean pairwise distance among present species.
inline std::vector<double> mpd(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    const auto& d = in.distances();
    std::vector<double> out(cdm.rows(), detail::NaN);
    for (size_t r = 0; r < cdm.rows(); ++r) {
        auto idx = cdm.present(r);
        if (idx.size() < 2) continue;
        double sum = 0.0;
        size_t pairs = 0;
        for (size_t i = 0; i < idx.size(); ++i) {
            for (size_t j = i + 1; j < idx.size(); ++j) {
                sum += d[idx[i]][idx[j]];
                ++pairs;
            }
        }
        out[r] = sum / static_cast<double>(pairs);
    }
    return out;
}

// Abundance-weighted MPD. Pair weights are products of abundances over the
// full present x present block, diagonal included.
inline std::vector<double> mpd_abundance(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    const auto& d = in.distances();
    std::vector<double> out(cdm.rows(), detail::NaN);
    for (size_t r = 0; r < cdm.rows(); ++r) {
        auto idx = cdm.present(r);
        if (idx.size() < 2) continue;
        double weighted = 0.0;
        double weights = 0.0;
        for (size_t i : idx) {
            for (size_t j : idx) {
                double w = cdm.at(r, i) * cdm.at(r, j);
                weighted += w * d[i][j];
                weights += w;
            }
        }
        out[r] = weighted / weights;
    }
    return out;
}

// Mean nearest-taxon distance.
inline std::vector<double> mntd(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    const auto& d = in.distances();
    std::vector<double> out(cdm.rows(), detail::NaN);
    for (size_t r = 0; r < cdm.rows(); ++r) {
        auto idx = cdm.present(r);
        if (idx.size() < 2) continue;
        double sum = 0.0;
        for (size_t i : idx) {
            double nearest = std::numeric_limits<double>::infinity();
            for (size_t j : idx) {
                if (i != j) nearest = std::min(nearest, d[i][j]);
            }
            sum += nearest;
        }
        out[r] = sum / static_cast<double>(idx.size());
    }
    return out;
}

// Phylogenetic species variability on the tip correlation matrix:
// (n * tr(C) - sum(C)) / (n * (n - 1)).
inline std::vector<double> psv(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    const auto& c = in.correlation();
    std::vector<double> out(cdm.rows(), detail::NaN);
    for (size_t r = 0; r < cdm.rows(); ++r) {
        auto idx = cdm.present(r);
        if (idx.size() < 2) continue;
        double n = static_cast<double>(idx.size());
        double trace = 0.0;
        double total = 0.0;
        for (size_t i : idx) {
            trace += c[i][i];
            for (size_t j : idx) total += c[i][j];
        }
        out[r] = (n * trace - total) / (n * (n - 1.0));
    }
    return out;
}

// Corrected phylogenetic species clustering: 1 - mean over species of the
// largest correlation with any other present species.
inline std::vector<double> psc(const MetricsInput& in) {
    const auto& cdm = in.cdm();
    const auto& c = in.correlation();
    std::vector<double> out(cdm.rows(), detail::NaN);
    for (size_t r = 0; r < cdm.rows(); ++r) {
        auto idx = cdm.present(r);
        if (idx.size() < 2) continue;
        double sum = 0.0;
        for (size_t i : idx) {
            double best = -1.0;
            for (size_t j : idx) {
                if (i != j) best = std::max(best, c[i][j]);
            }
            sum += best;
        }
        out[r] = 1.0 - sum / static_cast<double>(idx.size());
    }
    return out;
}

}  // namespace metric_catalogue
