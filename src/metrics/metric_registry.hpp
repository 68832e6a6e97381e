#pragma once

#include "analysis/tables.hpp"
#include "errors.hpp"
#include "metrics/metric_catalogue.hpp"
#include "metrics/metrics_input.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

struct NamedMetric {
    std::string name;
    MetricFn fn;
};

// ---------------------------------------------------------------------------
// MetricRegistry — ordered metric callables. The first entry is always
// richness, which downstream grouping depends on.
// ---------------------------------------------------------------------------
class MetricRegistry {
public:
    // Caller-supplied callables. richness is moved to the front when present
    // and taken from the catalogue when absent.
    static MetricRegistry from_functions(std::vector<NamedMetric> metrics) {
        std::set<std::string> seen;
        for (const auto& m : metrics) {
            if (m.name.empty()) throw std::invalid_argument("Metric with empty name");
            if (!m.fn) throw std::invalid_argument("Metric '" + m.name + "' has no function");
            if (!seen.insert(m.name).second) {
                throw std::invalid_argument("Duplicate metric name: " + m.name);
            }
        }

        std::vector<NamedMetric> ordered;
        ordered.reserve(metrics.size() + 1);
        auto it = std::find_if(metrics.begin(), metrics.end(),
                               [](const NamedMetric& m) { return m.name == RICHNESS; });
        if (it != metrics.end()) {
            ordered.push_back(*it);
        } else {
            ordered.push_back({RICHNESS, metric_catalogue::richness});
        }
        for (auto& m : metrics) {
            if (m.name != RICHNESS) ordered.push_back(std::move(m));
        }
        return MetricRegistry(std::move(ordered));
    }

    const std::vector<NamedMetric>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.name);
        return out;
    }

private:
    explicit MetricRegistry(std::vector<NamedMetric> entries) : entries_(std::move(entries)) {}

    std::vector<NamedMetric> entries_;
};

// Every built-in metric in reporting order.
inline const std::vector<NamedMetric>& default_metrics() {
    static const std::vector<NamedMetric> catalogue = {
        {"richness",      metric_catalogue::richness},
        {"pd",            metric_catalogue::pd},
        {"mpd",           metric_catalogue::mpd},
        {"mpd_abundance", metric_catalogue::mpd_abundance},
        {"mntd",          metric_catalogue::mntd},
        {"psv",           metric_catalogue::psv},
        {"psc",           metric_catalogue::psc},
    };
    return catalogue;
}

// ---------------------------------------------------------------------------
// check_metrics — resolve names against the catalogue. An empty selection
// means the full catalogue. Repeated names are kept once.
// ---------------------------------------------------------------------------
inline MetricRegistry check_metrics(const std::vector<std::string>& names = {}) {
    const auto& catalogue = default_metrics();
    if (names.empty()) return MetricRegistry::from_functions(catalogue);

    std::vector<NamedMetric> selected;
    std::set<std::string> seen;
    for (const auto& name : names) {
        auto it = std::find_if(catalogue.begin(), catalogue.end(),
                               [&](const NamedMetric& m) { return m.name == name; });
        if (it == catalogue.end()) throw InvalidMetricName(name);
        if (seen.insert(name).second) selected.push_back(*it);
    }
    return MetricRegistry::from_functions(std::move(selected));
}
