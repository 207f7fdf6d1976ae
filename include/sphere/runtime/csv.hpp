#pragma once

#include <sphere/core/value.hpp>

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace sphere::runtime {

/// Parse comma-separated rows; the first line names the columns.
///
/// Cells become numbers when they parse fully as one, booleans for
/// true/false (any case), Null when empty or `null`/`NA`, strings otherwise.
/// No quoting.
[[nodiscard]] auto parse_csv_rows(std::istream& input)
    -> std::expected<std::vector<Row>, std::string>;

[[nodiscard]] auto read_csv_rows(std::string_view path)
    -> std::expected<std::vector<Row>, std::string>;

/// Typed value for a single CSV cell, as parse_csv_rows() would store it.
[[nodiscard]] auto parse_cell(std::string_view text) -> Value;

}  // namespace sphere::runtime
