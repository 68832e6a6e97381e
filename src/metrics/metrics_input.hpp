#pragma once

#include "community/community_matrix.hpp"
#include "community/phylo_tree.hpp"
#include "errors.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PhyloCache — tree pruned to the CDM species plus the pairwise matrices the
// metrics need, aligned to the CDM column order. Shared read-only between
// every randomized CDM of a run.
// ---------------------------------------------------------------------------
struct PhyloCache {
    PhyloTree tree;
    std::vector<std::string> species;
    std::vector<std::vector<double>> distances;
    std::vector<std::vector<double>> correlation;
};

class MetricsInput;
inline MetricsInput prep_metrics(const PhyloTree& tree, const CommunityMatrix& cdm);

// ---------------------------------------------------------------------------
// MetricsInput — the context every metric callable receives. Only
// prep_metrics (and with_cdm on an existing input) can create one.
// ---------------------------------------------------------------------------
class MetricsInput {
public:
    const CommunityMatrix& cdm() const { return cdm_; }
    const PhyloTree& tree() const { return phylo_->tree; }
    const std::vector<std::vector<double>>& distances() const { return phylo_->distances; }
    const std::vector<std::vector<double>>& correlation() const { return phylo_->correlation; }

    // Same tree context for a randomized CDM over the same species columns.
    MetricsInput with_cdm(CommunityMatrix cdm) const {
        if (cdm.col_names() != phylo_->species) {
            throw InvalidInputType("Randomized CDM species do not match the prepared tree");
        }
        return MetricsInput(std::move(cdm), phylo_);
    }

    friend MetricsInput prep_metrics(const PhyloTree& tree, const CommunityMatrix& cdm);

private:
    MetricsInput(CommunityMatrix cdm, std::shared_ptr<const PhyloCache> phylo)
        : cdm_(std::move(cdm)), phylo_(std::move(phylo)) {}

    CommunityMatrix cdm_;
    std::shared_ptr<const PhyloCache> phylo_;
};

// Prune the tree to the CDM species and cache the pairwise matrices. Every
// CDM column must be a tip of the tree.
inline MetricsInput prep_metrics(const PhyloTree& tree, const CommunityMatrix& cdm) {
    if (cdm.cols() == 0) {
        throw InvalidInputType("CDM has no species columns");
    }
    for (const auto& species : cdm.col_names()) {
        if (tree.tip_index(species) < 0) {
            throw InvalidInputType("Tree is missing CDM species: " + species);
        }
    }

    auto cache = std::make_shared<PhyloCache>();
    cache->tree = tree.prune(cdm.col_names());
    cache->species = cdm.col_names();
    cache->distances = cache->tree.tip_distances(cache->species);
    cache->correlation = cache->tree.tip_correlation(cache->species);
    return MetricsInput(cdm, std::move(cache));
}

// Metric callable: one value per CDM row, NaN where the metric is undefined.
using MetricFn = std::function<std::vector<double>(const MetricsInput&)>;
