#pragma once

#include "community/community_matrix.hpp"
#include "spatial/quadrat_placer.hpp"

#include <optional>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// ArenaIndividual — one simulated individual at continuous coordinates
// ---------------------------------------------------------------------------
struct ArenaIndividual {
    std::string species;
    double x = 0.0;
    double y = 0.0;
};

// ---------------------------------------------------------------------------
// Arena — output of an upstream spatial simulation
// ---------------------------------------------------------------------------
struct Arena {
    int arena_length = 0;
    std::vector<ArenaIndividual> individuals;
    std::optional<std::vector<std::string>> regional_abundance;

    // Species in first-seen order, then regional pool species with no
    // individuals in the arena.
    std::vector<std::string> species() const {
        std::vector<std::string> out;
        std::set<std::string> seen;
        for (const auto& ind : individuals) {
            if (seen.insert(ind.species).second) out.push_back(ind.species);
        }
        if (regional_abundance.has_value()) {
            for (const auto& sp : *regional_abundance) {
                if (seen.insert(sp).second) out.push_back(sp);
            }
        }
        return out;
    }
};

// ---------------------------------------------------------------------------
// quadrat_contents — count individuals of each species inside each quadrat.
// Bounds are inclusive; rows are quadrat1..quadratK in placement order.
// ---------------------------------------------------------------------------
inline CommunityMatrix quadrat_contents(const std::vector<ArenaIndividual>& individuals,
                                        const std::vector<QuadratBounds>& bounds,
                                        const std::vector<std::string>& species) {
    std::unordered_map<std::string, size_t> column;
    for (size_t c = 0; c < species.size(); ++c) column.emplace(species[c], c);

    std::vector<std::string> rows;
    std::vector<std::vector<double>> values(bounds.size(), std::vector<double>(species.size(), 0.0));
    for (size_t q = 0; q < bounds.size(); ++q) {
        rows.push_back(quadrat_name(q));
        for (const auto& ind : individuals) {
            if (!bounds[q].contains(ind.x, ind.y)) continue;
            auto it = column.find(ind.species);
            if (it == column.end()) {
                throw std::invalid_argument("Arena individual of unlisted species: " + ind.species);
            }
            values[q][it->second] += 1.0;
        }
    }
    return CommunityMatrix(std::move(rows), species, std::move(values));
}

// ---------------------------------------------------------------------------
// SampledCommunity — CDM built from an arena plus its regional pool
// ---------------------------------------------------------------------------
struct SampledCommunity {
    CommunityMatrix cdm;
    std::vector<QuadratBounds> bounds;
    std::vector<std::string> regional_abundance;
    bool regional_derived = false;   // pool was not supplied by the arena
};

// Place quadrats in the arena and tabulate their contents. The arena's
// regional abundance is carried through when present.
inline SampledCommunity make_cdm(const Arena& arena, int no_quadrats, int quadrat_length,
                                 std::mt19937& rng) {
    SampledCommunity out;
    out.bounds = place_quadrats(no_quadrats, arena.arena_length, quadrat_length, rng);
    out.cdm = quadrat_contents(arena.individuals, out.bounds, arena.species());
    if (arena.regional_abundance.has_value()) {
        out.regional_abundance = *arena.regional_abundance;
    } else {
        out.regional_abundance = out.cdm.abundance_vector();
        out.regional_derived = true;
    }
    return out;
}
