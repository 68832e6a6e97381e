#pragma once

#include <cmath>
#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CommunityMatrix — sites x species abundance table (CDM)
//
// Rows are sampling units (sites or quadrats), columns are species. Richness
// is computed once at construction and carried with the matrix.
// ---------------------------------------------------------------------------
class CommunityMatrix {
public:
    CommunityMatrix() = default;

    CommunityMatrix(std::vector<std::string> row_names,
                    std::vector<std::string> col_names,
                    std::vector<std::vector<double>> values)
        : row_names_(std::move(row_names)),
          col_names_(std::move(col_names)),
          values_(std::move(values)) {
        validate();
        recompute_richness();
    }

    size_t rows() const { return row_names_.size(); }
    size_t cols() const { return col_names_.size(); }

    const std::vector<std::string>& row_names() const { return row_names_; }
    const std::vector<std::string>& col_names() const { return col_names_; }
    const std::vector<std::vector<double>>& values() const { return values_; }
    const std::vector<double>& row(size_t r) const { return values_[r]; }
    double at(size_t r, size_t c) const { return values_[r][c]; }

    const std::vector<int>& richness() const { return richness_; }
    int richness(size_t r) const { return richness_[r]; }

    // Column index of a species, or -1 when absent.
    int column_index(const std::string& species) const {
        for (size_t c = 0; c < col_names_.size(); ++c) {
            if (col_names_[c] == species) return static_cast<int>(c);
        }
        return -1;
    }

    // Indices of species present (abundance > 0) in row r.
    std::vector<size_t> present(size_t r) const {
        std::vector<size_t> idx;
        for (size_t c = 0; c < cols(); ++c) {
            if (values_[r][c] > 0.0) idx.push_back(c);
        }
        return idx;
    }

    std::vector<double> column_totals() const {
        std::vector<double> totals(cols(), 0.0);
        for (const auto& row : values_) {
            for (size_t c = 0; c < cols(); ++c) totals[c] += row[c];
        }
        return totals;
    }

    // Same labels, every non-zero entry replaced by 1.
    CommunityMatrix presence_absence() const {
        auto pa = values_;
        for (auto& row : pa) {
            for (double& v : row) v = (v > 0.0) ? 1.0 : 0.0;
        }
        return CommunityMatrix(row_names_, col_names_, std::move(pa));
    }

    // Same labels, new values (used by null models).
    CommunityMatrix with_values(std::vector<std::vector<double>> values) const {
        return CommunityMatrix(row_names_, col_names_, std::move(values));
    }

    // Regional pool multiset: each species repeated by its rounded column total.
    std::vector<std::string> abundance_vector() const {
        std::vector<std::string> pool;
        auto totals = column_totals();
        for (size_t c = 0; c < cols(); ++c) {
            long n = std::lround(totals[c]);
            for (long k = 0; k < n; ++k) pool.push_back(col_names_[c]);
        }
        return pool;
    }

private:
    std::vector<std::string> row_names_;
    std::vector<std::string> col_names_;
    std::vector<std::vector<double>> values_;
    std::vector<int> richness_;

    void validate() const {
        if (values_.size() != row_names_.size()) {
            throw std::invalid_argument("CDM has " + std::to_string(values_.size()) +
                                        " rows but " + std::to_string(row_names_.size()) +
                                        " row names");
        }
        std::set<std::string> seen;
        for (const auto& name : col_names_) {
            if (!seen.insert(name).second) {
                throw std::invalid_argument("Duplicate species column: " + name);
            }
        }
        for (size_t r = 0; r < values_.size(); ++r) {
            if (values_[r].size() != col_names_.size()) {
                throw std::invalid_argument("CDM row '" + row_names_[r] +
                                            "' does not match the species count");
            }
            for (double v : values_[r]) {
                if (!std::isfinite(v) || v < 0.0) {
                    throw std::invalid_argument("CDM row '" + row_names_[r] +
                                                "' holds a negative or non-finite abundance");
                }
            }
        }
    }

    void recompute_richness() {
        richness_.assign(values_.size(), 0);
        for (size_t r = 0; r < values_.size(); ++r) {
            for (double v : values_[r]) {
                if (v > 0.0) ++richness_[r];
            }
        }
    }
};
