#pragma once

#include "community/community_matrix.hpp"
#include "community/phylo_tree.hpp"
#include "errors.hpp"
#include "metrics/metrics_input.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

constexpr int DEFAULT_RANDOMIZATIONS = 100;
constexpr int DEFAULT_SWAP_ITERATIONS = 1000;

class NullsInput;
inline NullsInput prep_nulls(const PhyloTree& tree, const CommunityMatrix& cdm,
                             const std::optional<std::vector<std::string>>& regional = std::nullopt,
                             int randomizations = DEFAULT_RANDOMIZATIONS,
                             int swap_iterations = DEFAULT_SWAP_ITERATIONS);

// ---------------------------------------------------------------------------
// NullsInput — everything a null model needs: the observed CDM, the tree
// context for scoring its randomizations, and the regional species pool.
// Only prep_nulls can create one.
// ---------------------------------------------------------------------------
class NullsInput {
public:
    const CommunityMatrix& cdm() const { return metrics_.cdm(); }
    const MetricsInput& metrics() const { return metrics_; }
    const std::vector<std::string>& regional_abundance() const { return regional_; }
    bool regional_derived() const { return regional_derived_; }
    int randomizations() const { return randomizations_; }
    int swap_iterations() const { return swap_iterations_; }

    friend NullsInput prep_nulls(const PhyloTree& tree, const CommunityMatrix& cdm,
                                 const std::optional<std::vector<std::string>>& regional,
                                 int randomizations, int swap_iterations);

private:
    NullsInput(MetricsInput metrics, std::vector<std::string> regional, bool derived,
               int randomizations, int swap_iterations)
        : metrics_(std::move(metrics)),
          regional_(std::move(regional)),
          regional_derived_(derived),
          randomizations_(randomizations),
          swap_iterations_(swap_iterations) {}

    MetricsInput metrics_;
    std::vector<std::string> regional_;
    bool regional_derived_;
    int randomizations_;
    int swap_iterations_;
};

// Without a regional pool the CDM's own abundance vector is used and the
// context is flagged so the caller can warn about it.
inline NullsInput prep_nulls(const PhyloTree& tree, const CommunityMatrix& cdm,
                             const std::optional<std::vector<std::string>>& regional,
                             int randomizations, int swap_iterations) {
    if (randomizations <= 0) {
        throw InvalidInputType("Randomizations must be positive, got " +
                               std::to_string(randomizations));
    }
    if (swap_iterations < 0) {
        throw InvalidInputType("Swap iterations must be non-negative");
    }
    if (cdm.rows() == 0) {
        throw InvalidInputType("CDM has no sampling units");
    }

    auto metrics = prep_metrics(tree, cdm);

    std::vector<std::string> pool;
    bool derived = false;
    if (regional.has_value()) {
        pool = *regional;
        std::set<std::string> columns(cdm.col_names().begin(), cdm.col_names().end());
        for (const auto& species : pool) {
            if (columns.count(species) == 0) {
                throw InvalidInputType("Regional pool species not in CDM: " + species);
            }
        }
    } else {
        pool = cdm.abundance_vector();
        derived = true;
    }
    if (pool.empty()) {
        throw InvalidInputType("Regional species pool is empty");
    }

    return NullsInput(std::move(metrics), std::move(pool), derived, randomizations,
                      swap_iterations);
}
