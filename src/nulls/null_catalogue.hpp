#pragma once

#include "community/community_matrix.hpp"
#include "nulls/nulls_input.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <random>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Built-in null models. Each single-randomization routine returns one
// randomized CDM with the observed row and column labels; the catalogue
// wraps them to produce input.randomizations() replicates per call.
// ---------------------------------------------------------------------------
namespace null_catalogue {

using Values = std::vector<std::vector<double>>;

// Shuffle abundances within each row. Keeps every row's richness and
// abundance multiset.
inline CommunityMatrix shuffle_rows(const CommunityMatrix& cdm, std::mt19937& rng) {
    Values v = cdm.values();
    for (auto& row : v) std::shuffle(row.begin(), row.end(), rng);
    return cdm.with_values(std::move(v));
}

// Shuffle abundances within each column. Keeps every species' occurrence
// frequency and abundance multiset.
inline CommunityMatrix shuffle_columns(const CommunityMatrix& cdm, std::mt19937& rng) {
    Values v = cdm.values();
    std::vector<double> column(cdm.rows());
    for (size_t c = 0; c < cdm.cols(); ++c) {
        for (size_t r = 0; r < cdm.rows(); ++r) column[r] = v[r][c];
        std::shuffle(column.begin(), column.end(), rng);
        for (size_t r = 0; r < cdm.rows(); ++r) v[r][c] = column[r];
    }
    return cdm.with_values(std::move(v));
}

// Checkerboard swaps: pick two rows and two columns; when the 2x2 block is
// a checkerboard of occupied and empty cells, move each occupied abundance
// into the empty cell of its row. Row richness and column occurrence totals
// are preserved. `iterations` counts attempted swaps.
inline CommunityMatrix checkerboard_swaps(const CommunityMatrix& cdm, int iterations,
                                          std::mt19937& rng) {
    Values v = cdm.values();
    if (cdm.rows() < 2 || cdm.cols() < 2) return cdm.with_values(std::move(v));

    std::uniform_int_distribution<size_t> pick_row(0, cdm.rows() - 1);
    std::uniform_int_distribution<size_t> pick_col(0, cdm.cols() - 1);
    for (int i = 0; i < iterations; ++i) {
        size_t r1 = pick_row(rng), r2 = pick_row(rng);
        size_t c1 = pick_col(rng), c2 = pick_col(rng);
        if (r1 == r2 || c1 == c2) continue;

        bool a = v[r1][c1] > 0.0, b = v[r1][c2] > 0.0;
        bool c = v[r2][c1] > 0.0, d = v[r2][c2] > 0.0;
        if ((a && d && !b && !c) || (b && c && !a && !d)) {
            std::swap(v[r1][c1], v[r1][c2]);
            std::swap(v[r2][c1], v[r2][c2]);
        }
    }
    return cdm.with_values(std::move(v));
}

// Redraw each row's species from the regional pool, weighted by pool
// abundance and without replacement, keeping the row's richness. The row's
// observed abundances are carried over to the drawn species in random order.
// A row richer than the pool's distinct species gets every pool species.
inline CommunityMatrix regional_draw(const CommunityMatrix& cdm,
                                     const std::vector<std::string>& pool,
                                     std::mt19937& rng) {
    std::map<int, double> weight_by_column;
    for (const auto& species : pool) {
        int c = cdm.column_index(species);
        if (c >= 0) weight_by_column[c] += 1.0;
    }

    Values v(cdm.rows(), std::vector<double>(cdm.cols(), 0.0));
    for (size_t r = 0; r < cdm.rows(); ++r) {
        std::vector<double> abundances;
        for (double x : cdm.row(r)) {
            if (x > 0.0) abundances.push_back(x);
        }
        std::shuffle(abundances.begin(), abundances.end(), rng);

        std::vector<int> columns;
        std::vector<double> weights;
        for (const auto& [c, w] : weight_by_column) {
            columns.push_back(c);
            weights.push_back(w);
        }
        size_t draws = std::min(abundances.size(), columns.size());
        for (size_t k = 0; k < draws; ++k) {
            std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
            size_t chosen = pick(rng);
            v[r][columns[chosen]] = abundances[k];
            weights[chosen] = 0.0;
        }
    }
    return cdm.with_values(std::move(v));
}

// Permute species identities: one column permutation applied to every row,
// equivalent to shuffling the tip labels of the tree.
inline CommunityMatrix permute_species(const CommunityMatrix& cdm, std::mt19937& rng) {
    std::vector<size_t> perm(cdm.cols());
    std::iota(perm.begin(), perm.end(), 0);
    std::shuffle(perm.begin(), perm.end(), rng);

    Values v(cdm.rows(), std::vector<double>(cdm.cols(), 0.0));
    for (size_t r = 0; r < cdm.rows(); ++r) {
        for (size_t c = 0; c < cdm.cols(); ++c) v[r][perm[c]] = cdm.at(r, c);
    }
    return cdm.with_values(std::move(v));
}

template <typename Randomize>
std::vector<CommunityMatrix> replicate(const NullsInput& input, Randomize randomize) {
    std::vector<CommunityMatrix> out;
    out.reserve(input.randomizations());
    for (int i = 0; i < input.randomizations(); ++i) out.push_back(randomize());
    return out;
}

inline std::vector<CommunityMatrix> richness(const NullsInput& input, std::mt19937& rng) {
    return replicate(input, [&] { return shuffle_rows(input.cdm(), rng); });
}

inline std::vector<CommunityMatrix> frequency(const NullsInput& input, std::mt19937& rng) {
    return replicate(input, [&] { return shuffle_columns(input.cdm(), rng); });
}

inline std::vector<CommunityMatrix> independent_swap(const NullsInput& input, std::mt19937& rng) {
    return replicate(input, [&] {
        return checkerboard_swaps(input.cdm(), input.swap_iterations(), rng);
    });
}

inline std::vector<CommunityMatrix> regional(const NullsInput& input, std::mt19937& rng) {
    return replicate(input, [&] {
        return regional_draw(input.cdm(), input.regional_abundance(), rng);
    });
}

inline std::vector<CommunityMatrix> tip_shuffle(const NullsInput& input, std::mt19937& rng) {
    return replicate(input, [&] { return permute_species(input.cdm(), rng); });
}

}  // namespace null_catalogue
