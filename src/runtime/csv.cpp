#include <sphere/runtime/csv.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

namespace sphere::runtime {

namespace {

auto split_line(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

auto try_parse_double(std::string_view text, double& out) -> bool {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

}  // namespace

auto parse_cell(std::string_view text) -> Value {
    auto cell = trim(text);
    if (cell.empty() || iequals(cell, "null") || cell == "NA") {
        return Null{};
    }
    if (iequals(cell, "true")) {
        return true;
    }
    if (iequals(cell, "false")) {
        return false;
    }
    double number = 0.0;
    if (try_parse_double(cell, number)) {
        return number;
    }
    return std::string(cell);
}

auto parse_csv_rows(std::istream& input) -> std::expected<std::vector<Row>, std::string> {
    std::string header_line;
    if (!std::getline(input, header_line)) {
        return std::unexpected("csv is empty");
    }
    if (!header_line.empty() && header_line.back() == '\r') {
        header_line.pop_back();
    }

    std::vector<std::string> headers;
    for (const auto& name : split_line(header_line)) {
        headers.emplace_back(trim(name));
    }
    const auto blank = [](const std::string& h) { return h.empty(); };
    if (headers.empty() || std::ranges::any_of(headers, blank)) {
        return std::unexpected("csv has an empty header");
    }

    std::vector<Row> rows;
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        auto fields = split_line(line);
        if (fields.size() != headers.size()) {
            return std::unexpected(fmt::format("csv line {}: expected {} fields, found {}",
                                               line_no, headers.size(), fields.size()));
        }
        Row row;
        row.reserve(headers.size());
        for (std::size_t i = 0; i < fields.size(); ++i) {
            row.insert_or_assign(headers[i], parse_cell(fields[i]));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

auto read_csv_rows(std::string_view path) -> std::expected<std::vector<Row>, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected("failed to open csv: " + std::string(path));
    }
    return parse_csv_rows(input);
}

}  // namespace sphere::runtime
