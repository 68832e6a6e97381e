#pragma once

#include "community/community_matrix.hpp"
#include "community/phylo_tree.hpp"
#include "spatial/quadrat_contents.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace csv_detail {

inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        while (!cell.empty() && (cell.back() == '\r' || cell.back() == ' ')) cell.pop_back();
        size_t start = cell.find_first_not_of(' ');
        cells.push_back(start == std::string::npos ? "" : cell.substr(start));
    }
    if (!line.empty() && line.back() == ',') cells.push_back("");
    return cells;
}

inline double parse_number(const std::string& cell, const std::string& path, size_t line_no) {
    char* end = nullptr;
    double value = std::strtod(cell.c_str(), &end);
    if (cell.empty() || end == cell.c_str() || *end != '\0') {
        throw std::invalid_argument(path + ":" + std::to_string(line_no) +
                                    ": not a number: '" + cell + "'");
    }
    return value;
}

inline std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

}  // namespace csv_detail

// ---------------------------------------------------------------------------
// read_cdm_csv — header "<unit label>,sp1,sp2,...", then one row per unit:
// "<unit>,a1,a2,...". Blank lines are skipped.
// ---------------------------------------------------------------------------
inline CommunityMatrix read_cdm_csv(const std::string& path) {
    auto lines = csv_detail::read_lines(path);
    if (lines.empty()) throw std::invalid_argument(path + ": empty CDM file");

    auto header = csv_detail::split_line(lines[0]);
    if (header.size() < 2) throw std::invalid_argument(path + ": CDM header has no species");
    std::vector<std::string> species(header.begin() + 1, header.end());

    std::vector<std::string> units;
    std::vector<std::vector<double>> values;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) continue;
        auto cells = csv_detail::split_line(lines[i]);
        if (cells.size() != header.size()) {
            throw std::invalid_argument(path + ":" + std::to_string(i + 1) + ": expected " +
                                        std::to_string(header.size()) + " cells, got " +
                                        std::to_string(cells.size()));
        }
        units.push_back(cells[0]);
        std::vector<double> row;
        row.reserve(species.size());
        for (size_t c = 1; c < cells.size(); ++c) {
            row.push_back(csv_detail::parse_number(cells[c], path, i + 1));
        }
        values.push_back(std::move(row));
    }
    return CommunityMatrix(std::move(units), std::move(species), std::move(values));
}

// ---------------------------------------------------------------------------
// read_arena_csv — header "species,x,y", one individual per line
// ---------------------------------------------------------------------------
inline Arena read_arena_csv(const std::string& path, int arena_length) {
    if (arena_length <= 0) throw std::invalid_argument("Arena length must be positive");
    auto lines = csv_detail::read_lines(path);
    if (lines.empty()) throw std::invalid_argument(path + ": empty arena file");

    auto header = csv_detail::split_line(lines[0]);
    if (header.size() != 3 || header[0] != "species" || header[1] != "x" || header[2] != "y") {
        throw std::invalid_argument(path + ": arena header must be 'species,x,y'");
    }

    Arena arena;
    arena.arena_length = arena_length;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) continue;
        auto cells = csv_detail::split_line(lines[i]);
        if (cells.size() != 3) {
            throw std::invalid_argument(path + ":" + std::to_string(i + 1) +
                                        ": expected species,x,y");
        }
        arena.individuals.push_back({cells[0],
                                     csv_detail::parse_number(cells[1], path, i + 1),
                                     csv_detail::parse_number(cells[2], path, i + 1)});
    }
    return arena;
}

// Regional pool: species ids separated by newlines and/or commas.
inline std::vector<std::string> read_regional_abundance(const std::string& path) {
    std::vector<std::string> pool;
    for (const auto& line : csv_detail::read_lines(path)) {
        for (auto& cell : csv_detail::split_line(line)) {
            if (!cell.empty()) pool.push_back(std::move(cell));
        }
    }
    return pool;
}

inline PhyloTree read_newick_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open tree file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return PhyloTree::from_newick(ss.str());
}
