#pragma once

#include <sphere/core/error.hpp>
#include <sphere/core/value.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>

namespace sphere::runtime {

/// The closed set of functions a formula may call.
///
/// There is no registration API: a function exists only if it has an
/// enumerator here and a case in call_function().
enum class Function : std::uint8_t {
    Pow,
    Sqrt,
    Abs,
    Min,
    Max,
    Sum,
    Avg,
    Count,
    ColumnMin,
    ColumnMax,
    Dot,
    Norm,
};

struct FunctionInfo {
    Function id;
    std::string_view name;
};

/// Every callable function with its formula-level name.
[[nodiscard]] auto all_functions() noexcept -> std::span<const FunctionInfo>;

/// Resolve a callee by exact (case-sensitive) name.
[[nodiscard]] auto lookup_function(std::string_view name) noexcept -> std::optional<Function>;

[[nodiscard]] auto function_name(Function fn) noexcept -> std::string_view;

[[nodiscard]] inline auto is_function_name(std::string_view name) noexcept -> bool {
    return lookup_function(name).has_value();
}

/// DOT or NORM, compared case-insensitively. Their presence makes a formula
/// scenario-level.
[[nodiscard]] auto is_scenario_function(std::string_view name) noexcept -> bool;

/// SUM, AVG, COUNT, MIN or MAX (exact case): aggregates the caller may
/// precompute per column.
[[nodiscard]] auto is_aggregate_function(std::string_view name) noexcept -> bool;

/// Invoke `fn` on already-evaluated arguments.
///
/// The argument count is checked first: `pow(1, 2, None)` is an Arity error.
/// Otherwise a Null argument short-circuits to Null. sqrt() of a negative
/// number is Null, not an error. Misuse reports Arity, Shape or Type errors.
[[nodiscard]] auto call_function(Function fn, std::span<const Value> args)
    -> std::expected<Value, FormulaError>;

}  // namespace sphere::runtime
