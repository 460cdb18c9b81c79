//
// results.hpp - Per-dataset metric table and its CSV summary
//

#ifndef RESULTS_HPP
#define RESULTS_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "utils/config.hpp"

// ("mean_<column>", value) in column order
using MeanMetrics = std::vector<std::pair<std::string, double>>;

// Writes <results_path>/results.csv: a header, one line per row of results and
// a final line with the column means, with a leading "Row Names" column when
// row_names is given. An existing file is overwritten.
//
// Every row must have column_names.size() entries and row_names, if present,
// one entry per row; otherwise ShapeMismatchError is thrown and nothing is
// written. Means over an empty table are NaN.
MeanMetrics store_results(const std::string& results_path,
                          const std::vector<std::vector<double>>& results,
                          const std::optional<std::vector<std::string>>& row_names = std::nullopt,
                          const std::vector<std::string>& column_names = Config::metric_column_names());

// Column-wise arithmetic means of a rectangular table
std::vector<double> column_means(const std::vector<std::vector<double>>& results, size_t num_columns);

// Shortest text that reads back as the same double
std::string format_metric(double value);

// "name=v1,v2,..." -> (name, values). Throws std::invalid_argument when the
// '=' is missing or a value is not a complete number.
std::pair<std::string, std::vector<double>> parse_result_row(const std::string& entry);

// One CSV field, quoted only when it contains a delimiter, quote or line break
std::string csv_field(const std::string& value);

#endif //RESULTS_HPP
