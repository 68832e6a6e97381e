#pragma once

#include "analysis/tables.hpp"
#include "metrics/metric_registry.hpp"
#include "metrics/metrics_input.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// run_metrics — apply every registry entry to a prepared input. Rows follow
// the CDM row order; columns follow registry order (richness first).
// ---------------------------------------------------------------------------
inline MetricTable run_metrics(const MetricsInput& input, const MetricRegistry& registry) {
    const auto& cdm = input.cdm();
    MetricTable table;
    table.units = cdm.row_names();
    table.metric_names = registry.names();
    table.columns.reserve(registry.size());

    for (const auto& metric : registry.entries()) {
        auto values = metric.fn(input);
        if (values.size() != cdm.rows()) {
            throw std::logic_error("Metric '" + metric.name + "' returned " +
                                   std::to_string(values.size()) + " values for " +
                                   std::to_string(cdm.rows()) + " units");
        }
        table.columns.push_back(std::move(values));
    }
    return table;
}

// Prepare and run in one step.
inline MetricTable calc_metrics(const PhyloTree& tree, const CommunityMatrix& cdm,
                                const MetricRegistry& registry = check_metrics()) {
    return run_metrics(prep_metrics(tree, cdm), registry);
}
