#pragma once

#include "errors.hpp"

#include <random>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// QuadratBounds — axis-aligned square sampling window. Position in the
// placement vector is the quadrat's identity (quadrat1 = index 0).
// ---------------------------------------------------------------------------
struct QuadratBounds {
    double x_min = 0.0;
    double x_max = 0.0;
    double y_min = 0.0;
    double y_max = 0.0;

    // Closed boxes: shared edges count as overlap.
    bool overlaps(const QuadratBounds& other) const {
        bool x_overlap = x_min <= other.x_max && other.x_min <= x_max;
        bool y_overlap = y_min <= other.y_max && other.y_min <= y_max;
        return x_overlap && y_overlap;
    }

    bool contains(double x, double y) const {
        return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
    }
};

inline std::string quadrat_name(size_t index) {
    return "quadrat" + std::to_string(index + 1);
}

// Largest fraction of the arena the quadrats may cover in expectation.
constexpr double MAX_COVERED_FRACTION = 0.4;
constexpr int DEFAULT_PLACEMENT_RETRIES = 100000;

// ---------------------------------------------------------------------------
// check_quadrat_density — throws InfeasibleParameters for a request that
// cannot or should not be sampled. Exactly MAX_COVERED_FRACTION passes.
// ---------------------------------------------------------------------------
inline void check_quadrat_density(int count, int arena_length, int quadrat_length) {
    if (count < 0) {
        throw InfeasibleParameters("Quadrat count must be non-negative");
    }
    if (quadrat_length <= 0 || quadrat_length > arena_length) {
        throw InfeasibleParameters("Quadrat length must be in (0, arena length]");
    }
    // count * L^2 / A^2 > 2/5, compared in integers so the limit itself passes
    long long quadrat_area = static_cast<long long>(quadrat_length) * quadrat_length;
    long long arena_area = static_cast<long long>(arena_length) * arena_length;
    if (5LL * count * quadrat_area > 2LL * arena_area) {
        double covered = static_cast<double>(count * quadrat_area) / static_cast<double>(arena_area);
        throw InfeasibleParameters(
            "Quadrat and/or arena size parameters unsuitable: quadrats would cover " +
            std::to_string(covered) + " of the arena (limit " +
            std::to_string(MAX_COVERED_FRACTION) + "). Sample less of the arena");
    }
}

// ---------------------------------------------------------------------------
// place_quadrats — rejection-sample `count` non-overlapping quadrats of side
// `quadrat_length` with integer origins inside a square arena.
//
// The density check runs before any draw. It bounds the expected number of
// rejections but does not guarantee termination, so each quadrat also has a
// hard cap of `max_retries` rejected draws.
// ---------------------------------------------------------------------------
inline std::vector<QuadratBounds> place_quadrats(int count,
                                                 int arena_length,
                                                 int quadrat_length,
                                                 std::mt19937& rng,
                                                 int max_retries = DEFAULT_PLACEMENT_RETRIES) {
    check_quadrat_density(count, arena_length, quadrat_length);

    std::uniform_int_distribution<int> origin(0, arena_length - quadrat_length);
    std::vector<QuadratBounds> placed;
    placed.reserve(count);

    for (int i = 0; i < count; ++i) {
        int attempts = 0;
        for (;;) {
            if (attempts == max_retries) {
                throw PlacementRetriesExhausted(i + 1, max_retries);
            }
            ++attempts;

            double x = static_cast<double>(origin(rng));
            double y = static_cast<double>(origin(rng));
            QuadratBounds candidate{x, x + quadrat_length, y, y + quadrat_length};

            bool ok = true;
            for (const auto& q : placed) {
                if (candidate.overlaps(q)) {
                    ok = false;
                    break;
                }
            }
            if (ok) {
                placed.push_back(candidate);
                break;
            }
        }
    }
    return placed;
}
