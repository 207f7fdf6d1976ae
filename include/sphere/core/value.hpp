#pragma once

#include <sphere/core/column.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace sphere {

/// The "not applicable" sentinel. Produced by sqrt() of a negative number and
/// by the `None` literal; operators and calls propagate it.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

using Value = std::variant<Null, double, bool, std::string, Vector>;

enum class ValueKind : std::uint8_t {
    Null,
    Number,
    Bool,
    String,
    Vector,
};

/// Column name -> value for one record.
using Row = std::unordered_map<std::string, Value>;

/// Precomputed values overlaid under a Row during lookup (row wins).
using AggregateContext = std::unordered_map<std::string, Value>;

[[nodiscard]] auto kind_of(const Value& value) noexcept -> ValueKind;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<Null>(value);
}

/// Numeric view of a scalar: doubles as-is, bools as 0/1. nullopt otherwise.
[[nodiscard]] auto as_number(const Value& value) noexcept -> std::optional<double>;

[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> std::string_view;

/// Human-readable shape, e.g. "scalar number", "vector of length 3".
[[nodiscard]] auto describe_shape(const Value& value) -> std::string;

/// Render a value for display ("null", "1.5", "true", "[1, 2, 3]").
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Shortest round-trippable rendering of a double ("2", "0.5", "nan", "inf").
[[nodiscard]] auto format_number(double value) -> std::string;

}  // namespace sphere
