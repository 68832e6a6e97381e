#pragma once

#include "analysis/robust_test.hpp"
#include "analysis/tables.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ExportColumn / ExportTable — format-neutral column view of a result table,
// shared by the CSV exporter and the Parquet writer.
// ---------------------------------------------------------------------------
struct ExportColumn {
    enum class Kind { TEXT, REAL, INTEGER };

    std::string name;
    Kind kind = Kind::REAL;
    std::vector<std::string> text;
    std::vector<double> real;
    std::vector<int64_t> integer;

    size_t size() const {
        switch (kind) {
            case Kind::TEXT:    return text.size();
            case Kind::REAL:    return real.size();
            case Kind::INTEGER: return integer.size();
        }
        return 0;
    }
};

struct ExportTable {
    std::vector<ExportColumn> columns;

    size_t rows() const { return columns.empty() ? 0 : columns.front().size(); }

    void add_text(const std::string& name, std::vector<std::string> values) {
        ExportColumn col;
        col.name = name;
        col.kind = ExportColumn::Kind::TEXT;
        col.text = std::move(values);
        columns.push_back(std::move(col));
    }

    void add_real(const std::string& name, std::vector<double> values) {
        ExportColumn col;
        col.name = name;
        col.kind = ExportColumn::Kind::REAL;
        col.real = std::move(values);
        columns.push_back(std::move(col));
    }

    void add_integer(const std::string& name, const std::vector<int>& values) {
        ExportColumn col;
        col.name = name;
        col.kind = ExportColumn::Kind::INTEGER;
        col.integer.assign(values.begin(), values.end());
        columns.push_back(std::move(col));
    }
};

// Observed metrics: unit, richness, metrics...
inline ExportTable to_export_table(const MetricTable& table) {
    ExportTable out;
    out.add_text("quadrat", table.units);
    for (size_t m = 0; m < table.metric_names.size(); ++m) {
        out.add_real(table.metric_names[m], table.columns[m]);
    }
    return out;
}

// SES: unit, grouping key, metrics...
inline ExportTable to_export_table(const SESTable& table) {
    ExportTable out;
    out.add_text("quadrat", table.units);
    if (table.group_by == GroupBy::RICHNESS) out.add_text(RICHNESS, table.keys);
    for (size_t m = 0; m < table.metric_names.size(); ++m) {
        out.add_real(table.metric_names[m], table.columns[m]);
    }
    return out;
}

inline ExportTable to_export_table(const SignificanceTable& table) {
    ExportTable out;
    out.add_text("quadrat", table.units);
    if (table.group_by == GroupBy::RICHNESS) out.add_text(RICHNESS, table.keys);
    for (size_t m = 0; m < table.metric_names.size(); ++m) {
        out.add_integer(table.metric_names[m], table.columns[m]);
    }
    return out;
}

// Per-group summary: key, then <metric>.mean/.sd/.ci_lower/.ci_upper/.n
inline ExportTable to_export_table(const SummaryTable& table) {
    ExportTable out;
    out.add_text(group_by_name(table.group_by), table.keys);
    for (size_t m = 0; m < table.metric_names.size(); ++m) {
        const auto& name = table.metric_names[m];
        const auto& s = table.stats[m];
        out.add_real(name + ".mean", s.mean);
        out.add_real(name + ".sd", s.sd);
        out.add_real(name + ".ci_lower", s.ci_lower);
        out.add_real(name + ".ci_upper", s.ci_upper);
        out.add_integer(name + ".n", s.n);
    }
    return out;
}

inline ExportTable to_export_table(const std::vector<RobustTestResult>& results) {
    std::vector<std::string> metric;
    std::vector<double> estimate, p_value, corrected;
    std::vector<int> n;
    for (const auto& r : results) {
        metric.push_back(r.metric);
        estimate.push_back(r.estimate);
        p_value.push_back(r.p_value);
        corrected.push_back(r.corrected_p_value);
        n.push_back(r.sample_count);
    }
    ExportTable out;
    out.add_text("metric", std::move(metric));
    out.add_real("estimate", std::move(estimate));
    out.add_real("p_value", std::move(p_value));
    out.add_real("corrected_p_value", std::move(corrected));
    out.add_integer("n", n);
    return out;
}

// ---------------------------------------------------------------------------
// ExportConfig
// ---------------------------------------------------------------------------
struct ExportConfig {
    std::string output_path;
};

// ---------------------------------------------------------------------------
// TableExporter — CSV writer. Missing values are written as "NaN".
// ---------------------------------------------------------------------------
class TableExporter {
public:
    TableExporter() = default;
    explicit TableExporter(const ExportConfig& config) : config_(config) {}

    std::string header_line(const ExportTable& table) const {
        std::ostringstream ss;
        for (size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) ss << ",";
            ss << table.columns[c].name;
        }
        return ss.str();
    }

    std::string format_row(const ExportTable& table, size_t row) const {
        std::ostringstream ss;
        for (size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) ss << ",";
            const auto& col = table.columns[c];
            switch (col.kind) {
                case ExportColumn::Kind::TEXT:    ss << col.text[row]; break;
                case ExportColumn::Kind::REAL:    ss << format_float(col.real[row]); break;
                case ExportColumn::Kind::INTEGER: ss << col.integer[row]; break;
            }
        }
        return ss.str();
    }

    void export_csv(const ExportTable& table) const {
        if (config_.output_path.empty()) {
            throw std::invalid_argument("No output path configured");
        }
        for (const auto& col : table.columns) {
            if (col.size() != table.rows()) {
                throw std::logic_error("Column '" + col.name + "' has " +
                                       std::to_string(col.size()) + " rows, expected " +
                                       std::to_string(table.rows()));
            }
        }

        auto parent = std::filesystem::path(config_.output_path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }

        std::ofstream file(config_.output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + config_.output_path);
        }
        file << header_line(table) << "\n";
        for (size_t r = 0; r < table.rows(); ++r) {
            file << format_row(table, r) << "\n";
        }
    }

    static std::string format_float(double val) {
        if (std::isnan(val)) return "NaN";
        if (std::isinf(val)) return val > 0 ? "Inf" : "-Inf";
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.17g", val);
        return buf;
    }

private:
    ExportConfig config_;
};
