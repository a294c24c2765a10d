#include "io/txt_data_importer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ocdb {

namespace {

bool
is_comment_or_blank(const std::string &line) {
    for (char c : line) {
        if (c == '#') { return true; }
        if (!std::isspace(static_cast<unsigned char>(c))) { return false; }
    }
    return true;
}

std::vector<double>
parse_row(const std::string &line, const std::string &filename, std::size_t line_number) {
    std::istringstream ss(line);
    std::vector<double> row;
    std::string token;
    while (ss >> token) {
        try {
            std::size_t consumed = 0;
            row.push_back(std::stod(token, &consumed));
            if (consumed != token.size()) { throw std::invalid_argument(token); }
        } catch (const std::logic_error &) { // invalid_argument, out_of_range
            throw std::runtime_error(filename + ":" + std::to_string(line_number) + ": not a number: '" + token +
                                     "'");
        }
    }
    return row;
}

} // namespace

void
TxtDataImporter::read_data(Material &material) {
    std::ifstream in(data_filename);
    if (!in) { throw std::runtime_error("Cannot open data file: " + data_filename); }

    std::vector<std::vector<double>> rows;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (is_comment_or_blank(line)) { continue; }
        auto row = parse_row(line, data_filename, line_number);
        if (row.size() != 3 && row.size() != 7) {
            throw std::runtime_error(data_filename + ":" + std::to_string(line_number) + ": expected 3 or 7 columns, got " +
                                     std::to_string(row.size()));
        }
        if (std::any_of(row.begin(), row.end(), [](double value) { return !std::isfinite(value); })) {
            throw std::runtime_error(data_filename + ":" + std::to_string(line_number) + ": non-finite value");
        }
        if (row[0] <= 0.0) {
            throw std::runtime_error(data_filename + ":" + std::to_string(line_number) +
                                     ": wavelength must be positive, got " + std::to_string(row[0]));
        }
        if (!rows.empty() && rows.front().size() != row.size()) {
            throw std::runtime_error(data_filename + ":" + std::to_string(line_number) +
                                     ": inconsistent number of columns");
        }
        rows.push_back(std::move(row));
    }
    if (rows.empty()) { throw std::runtime_error("No data in " + data_filename); }

    std::sort(rows.begin(), rows.end(), [](const auto &a, const auto &b) { return a[0] < b[0]; });
    auto duplicate = std::adjacent_find(rows.begin(), rows.end(), [](const auto &a, const auto &b) { return a[0] == b[0]; });
    if (duplicate != rows.end()) {
        throw std::runtime_error("Duplicate wavelength " + std::to_string((*duplicate)[0]) + " in " + data_filename);
    }

    Axis &axis = material.n_data.axes[0];
    axis.quantity = "wavelength";
    axis.symbol = "\\lambda";
    axis.unit = "nm";
    const bool with_uncertainties = rows.front().size() == 7;
    for (const auto &row : rows) {
        axis.values.push_back(row[0]);
        material.n_data.data.push_back(row[1]);
        material.k_data.data.push_back(row[2]);
        if (with_uncertainties) {
            material.n_data.lower_bounds.push_back(row[3]);
            material.n_data.upper_bounds.push_back(row[4]);
            material.k_data.lower_bounds.push_back(row[5]);
            material.k_data.upper_bounds.push_back(row[6]);
        }
    }
    material.k_data.axes[0] = axis;
}

} // namespace ocdb
