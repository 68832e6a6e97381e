#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Domain errors raised at validation boundaries. Numerical stages never throw
// these; they propagate NaN instead.
// ---------------------------------------------------------------------------

// A prepared context could not be built from the supplied inputs.
class InvalidInputType : public std::invalid_argument {
public:
    explicit InvalidInputType(const std::string& what) : std::invalid_argument(what) {}
};

// Quadrat placement parameters fail the density precondition.
class InfeasibleParameters : public std::invalid_argument {
public:
    explicit InfeasibleParameters(const std::string& what) : std::invalid_argument(what) {}
};

// Rejection sampling hit its per-quadrat retry cap.
class PlacementRetriesExhausted : public std::runtime_error {
public:
    PlacementRetriesExhausted(int quadrat, int retries)
        : std::runtime_error("Could not place quadrat " + std::to_string(quadrat) +
                             " after " + std::to_string(retries) + " attempts"),
          quadrat_(quadrat) {}

    int quadrat() const { return quadrat_; }

private:
    int quadrat_;
};

// Caller asked for a metric or null model that is not in the catalogue.
class UnknownRegistryName : public std::invalid_argument {
public:
    UnknownRegistryName(const std::string& kind, const std::string& name)
        : std::invalid_argument(kind + " not in catalogue: '" + name + "'"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class InvalidMetricName : public UnknownRegistryName {
public:
    explicit InvalidMetricName(const std::string& name) : UnknownRegistryName("Metric", name) {}
};

class InvalidNullName : public UnknownRegistryName {
public:
    explicit InvalidNullName(const std::string& name) : UnknownRegistryName("Null model", name) {}
};

// An observed row has no matching summary row.
class UnmatchedGroupingKey : public std::runtime_error {
public:
    UnmatchedGroupingKey(const std::string& key, const std::string& unit)
        : std::runtime_error("No summary row for grouping key '" + key +
                             "' (unit '" + unit + "')"),
          key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};
