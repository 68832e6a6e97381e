#pragma once

#include "errors.hpp"
#include "nulls/null_catalogue.hpp"
#include "nulls/nulls_input.hpp"

#include <algorithm>
#include <functional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Null model callable: randomized CDMs drawn from rng. The built-in models
// return input.randomizations() of them; others may return any number.
using NullFn = std::function<std::vector<CommunityMatrix>(const NullsInput&, std::mt19937&)>;

struct NamedNull {
    std::string name;
    NullFn fn;
};

// ---------------------------------------------------------------------------
// NullRegistry — ordered null model callables
// ---------------------------------------------------------------------------
class NullRegistry {
public:
    static NullRegistry from_functions(std::vector<NamedNull> nulls) {
        std::set<std::string> seen;
        for (const auto& n : nulls) {
            if (n.name.empty()) throw std::invalid_argument("Null model with empty name");
            if (!n.fn) throw std::invalid_argument("Null model '" + n.name + "' has no function");
            if (!seen.insert(n.name).second) {
                throw std::invalid_argument("Duplicate null model name: " + n.name);
            }
        }
        return NullRegistry(std::move(nulls));
    }

    const std::vector<NamedNull>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.name);
        return out;
    }

private:
    explicit NullRegistry(std::vector<NamedNull> entries) : entries_(std::move(entries)) {}

    std::vector<NamedNull> entries_;
};

inline const std::vector<NamedNull>& default_nulls() {
    static const std::vector<NamedNull> catalogue = {
        {"richness",         null_catalogue::richness},
        {"frequency",        null_catalogue::frequency},
        {"independent_swap", null_catalogue::independent_swap},
        {"regional",         null_catalogue::regional},
        {"tip_shuffle",      null_catalogue::tip_shuffle},
    };
    return catalogue;
}

// Resolve null model names; an empty selection means the full catalogue.
inline NullRegistry check_nulls(const std::vector<std::string>& names = {}) {
    const auto& catalogue = default_nulls();
    if (names.empty()) return NullRegistry::from_functions(catalogue);

    std::vector<NamedNull> selected;
    std::set<std::string> seen;
    for (const auto& name : names) {
        auto it = std::find_if(catalogue.begin(), catalogue.end(),
                               [&](const NamedNull& n) { return n.name == name; });
        if (it == catalogue.end()) throw InvalidNullName(name);
        if (seen.insert(name).second) selected.push_back(*it);
    }
    return NullRegistry::from_functions(std::move(selected));
}
