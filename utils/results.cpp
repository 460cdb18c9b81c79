//
// results.cpp - Column means and results.csv
//

#include "results.hpp"
#include "errors.hpp"

#include <torch/torch.h>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

void write_csv_row(std::ofstream& file, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) file << ",";
        file << csv_field(fields[i]);
    }
    file << "\r\n";
}

} // namespace

std::string format_metric(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        throw std::runtime_error("Failed to format metric value");
    }
    return std::string(buffer, end);
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::vector<double> column_means(const std::vector<std::vector<double>>& results, size_t num_columns) {
    if (results.empty()) {
        return std::vector<double>(num_columns, std::numeric_limits<double>::quiet_NaN());
    }

    std::vector<double> flat;
    flat.reserve(results.size() * num_columns);
    for (const auto& row : results) {
        flat.insert(flat.end(), row.begin(), row.end());
    }

    auto table = torch::from_blob(flat.data(),
                                  {static_cast<int64_t>(results.size()), static_cast<int64_t>(num_columns)},
                                  torch::kFloat64);
    auto means = table.mean(0).contiguous();

    return std::vector<double>(means.data_ptr<double>(), means.data_ptr<double>() + num_columns);
}

MeanMetrics store_results(const std::string& results_path,
                          const std::vector<std::vector<double>>& results,
                          const std::optional<std::vector<std::string>>& row_names,
                          const std::vector<std::string>& column_names) {
    if (row_names && row_names->size() != results.size()) {
        throw ShapeMismatchError("#Rownames != #Result-rows (" + std::to_string(row_names->size()) +
                                 " vs " + std::to_string(results.size()) + ")");
    }
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].size() != column_names.size()) {
            throw ShapeMismatchError("Result row " + std::to_string(i) + " has " +
                                     std::to_string(results[i].size()) + " values for " +
                                     std::to_string(column_names.size()) + " columns");
        }
    }

    auto means = column_means(results, column_names.size());
    for (size_t i = 0; i < column_names.size(); ++i) {
        std::ostringstream line;
        line << column_names[i] << ": " << std::fixed << std::setprecision(3) << means[i];
        std::cout << line.str() << std::endl;
    }

    fs::path savename = fs::path(results_path) / Config::RESULTS_FILENAME;
    std::ofstream csv_file(savename, std::ios::out | std::ios::trunc);
    if (!csv_file) {
        throw std::runtime_error("Failed to open " + savename.string() + " for writing");
    }

    std::vector<std::string> header;
    if (row_names) header.emplace_back("Row Names");
    header.insert(header.end(), column_names.begin(), column_names.end());
    write_csv_row(csv_file, header);

    for (size_t i = 0; i < results.size(); ++i) {
        std::vector<std::string> row;
        if (row_names) row.push_back((*row_names)[i]);
        for (double value : results[i]) {
            row.push_back(format_metric(value));
        }
        write_csv_row(csv_file, row);
    }

    std::vector<std::string> mean_row;
    if (row_names) mean_row.emplace_back("Mean");
    for (double value : means) {
        mean_row.push_back(format_metric(value));
    }
    write_csv_row(csv_file, mean_row);

    csv_file.close();
    if (!csv_file) {
        throw std::runtime_error("Failed to write " + savename.string());
    }

    MeanMetrics mean_metrics;
    for (size_t i = 0; i < column_names.size(); ++i) {
        mean_metrics.emplace_back("mean_" + column_names[i], means[i]);
    }
    return mean_metrics;
}

std::pair<std::string, std::vector<double>> parse_result_row(const std::string& entry) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Invalid result row '" + entry + "'. Use name=v1,v2,v3,v4,v5.");
    }

    std::string name = entry.substr(0, eq);
    std::vector<double> row;
    std::stringstream values(entry.substr(eq + 1));
    std::string value;
    while (std::getline(values, value, ',')) {
        size_t parsed = 0;
        double number = 0.0;
        try {
            number = std::stod(value, &parsed);
        } catch (const std::exception&) {
            parsed = 0;
        }
        if (parsed == 0 || parsed != value.size()) {
            throw std::invalid_argument("Invalid metric value '" + value + "' in row " + name);
        }
        row.push_back(number);
    }
    return {name, row};
}
