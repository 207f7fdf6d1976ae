#include <sphere/runtime/functions.hpp>
#include <sphere/runtime/vector_ops.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>

namespace sphere::runtime {

namespace {

constexpr std::array<FunctionInfo, 12> kFunctions = {{
    {Function::Pow, "pow"},
    {Function::Sqrt, "sqrt"},
    {Function::Abs, "abs"},
    {Function::Min, "min"},
    {Function::Max, "max"},
    {Function::Sum, "SUM"},
    {Function::Avg, "AVG"},
    {Function::Count, "COUNT"},
    {Function::ColumnMin, "MIN"},
    {Function::ColumnMax, "MAX"},
    {Function::Dot, "DOT"},
    {Function::Norm, "NORM"},
}};

using CallResult = std::expected<Value, FormulaError>;

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::toupper(static_cast<unsigned char>(a)) ==
                      std::toupper(static_cast<unsigned char>(b));
           });
}

auto arity_error(Function fn, std::string_view expected, std::size_t got) -> FormulaError {
    return make_error(ErrorKind::Arity, fmt::format("{}() takes {}, got {}", function_name(fn),
                                                    expected, got));
}

// Argument-count rules, checked before Null propagation so a misused call
// is an error even when one of its arguments is None.
auto check_arity(Function fn, std::size_t count) -> std::optional<FormulaError> {
    switch (fn) {
        case Function::Pow:
            if (count == 1 || count == 2) {
                return std::nullopt;
            }
            return arity_error(fn, "1 or 2 arguments", count);
        case Function::Min:
        case Function::Max:
            if (count >= 1) {
                return std::nullopt;
            }
            return arity_error(fn, "at least 1 argument", count);
        case Function::Dot:
            if (count == 2) {
                return std::nullopt;
            }
            return arity_error(fn, "exactly 2 arguments", count);
        case Function::Sqrt:
        case Function::Abs:
        case Function::Sum:
        case Function::Avg:
        case Function::Count:
        case Function::ColumnMin:
        case Function::ColumnMax:
        case Function::Norm:
            if (count == 1) {
                return std::nullopt;
            }
            return arity_error(fn, "exactly 1 argument", count);
    }
    return std::nullopt;
}

auto ordinal(std::size_t index) -> std::string_view {
    switch (index) {
        case 0:
            return "first";
        case 1:
            return "second";
        default:
            return "third";
    }
}

// Returns the vector argument or a ShapeError naming the argument.
auto require_vector(Function fn, std::span<const Value> args, std::size_t index)
    -> std::expected<const Vector*, FormulaError> {
    if (const auto* vec = std::get_if<Vector>(&args[index])) {
        return vec;
    }
    return std::unexpected(make_error(
        ErrorKind::Shape,
        fmt::format("{}() expects its {} argument to be a 1-D vector, got {}", function_name(fn),
                    ordinal(index), describe_shape(args[index]))));
}

auto require_number(Function fn, const Value& arg) -> std::expected<double, FormulaError> {
    if (auto number = as_number(arg)) {
        return *number;
    }
    if (std::holds_alternative<Vector>(arg)) {
        return std::unexpected(make_error(
            ErrorKind::Shape, fmt::format("{}() expects a scalar, got {}", function_name(fn),
                                          describe_shape(arg))));
    }
    return std::unexpected(make_error(
        ErrorKind::Type, fmt::format("{}() expects a number, got {}", function_name(fn),
                                     kind_name(kind_of(arg)))));
}

auto call_pow(std::span<const Value> args) -> CallResult {
    const auto power = [](double base, double exponent) {
        return std::pow(base, exponent);
    };
    if (args.size() == 1) {
        return broadcast(args[0], args[0], [](double x, double) { return x * x; }, "pow()");
    }
    if (args.size() == 2) {
        return broadcast(args[0], args[1], power, "pow()");
    }
    return std::unexpected(arity_error(Function::Pow, "1 or 2 arguments", args.size()));
}

auto call_sqrt(std::span<const Value> args) -> CallResult {
    if (args.size() != 1) {
        return std::unexpected(arity_error(Function::Sqrt, "exactly 1 argument", args.size()));
    }
    auto x = require_number(Function::Sqrt, args[0]);
    if (!x) {
        return std::unexpected(x.error());
    }
    if (*x < 0.0) {
        return Value{Null{}};
    }
    return Value{std::sqrt(*x)};
}

auto call_abs(std::span<const Value> args) -> CallResult {
    if (args.size() != 1) {
        return std::unexpected(arity_error(Function::Abs, "exactly 1 argument", args.size()));
    }
    if (const auto* vec = std::get_if<Vector>(&args[0])) {
        return Value{vec->map([](double x) { return std::fabs(x); })};
    }
    auto x = require_number(Function::Abs, args[0]);
    if (!x) {
        return std::unexpected(x.error());
    }
    return Value{std::fabs(*x)};
}

// min()/max(): one vector argument, or two or more scalars.
template <typename Better>
auto call_extreme(Function fn, std::span<const Value> args, Better better) -> CallResult {
    if (args.empty()) {
        return std::unexpected(arity_error(fn, "at least 1 argument", 0));
    }
    if (args.size() == 1) {
        const auto* vec = std::get_if<Vector>(&args[0]);
        if (vec == nullptr) {
            return std::unexpected(make_error(
                ErrorKind::Shape,
                fmt::format("{}() with one argument expects a vector, got {}", function_name(fn),
                            describe_shape(args[0]))));
        }
        if (vec->empty()) {
            return std::unexpected(make_error(
                ErrorKind::Shape, fmt::format("{}() arg is an empty vector", function_name(fn))));
        }
        double best = (*vec)[0];
        for (double element : *vec) {
            if (better(element, best)) {
                best = element;
            }
        }
        return Value{best};
    }
    double best = 0.0;
    for (std::size_t i = 0; i < args.size(); ++i) {
        auto x = require_number(fn, args[i]);
        if (!x) {
            return std::unexpected(x.error());
        }
        if (i == 0 || better(*x, best)) {
            best = *x;
        }
    }
    return Value{best};
}

// Single-vector aggregates (SUM, AVG, COUNT, MIN, MAX, NORM).
template <typename Reduce>
auto call_reduction(Function fn, std::span<const Value> args, Reduce reduce) -> CallResult {
    if (args.size() != 1) {
        return std::unexpected(arity_error(fn, "exactly 1 argument", args.size()));
    }
    auto vec = require_vector(fn, args, 0);
    if (!vec) {
        return std::unexpected(vec.error());
    }
    return Value{reduce(**vec)};
}

auto column_extreme(const Vector& vec, bool want_max) -> double {
    double best = std::numeric_limits<double>::quiet_NaN();
    vec.for_each_present([&](double element) {
        if (std::isnan(best) || (want_max ? element > best : element < best)) {
            best = element;
        }
    });
    return best;
}

auto call_dot(std::span<const Value> args) -> CallResult {
    if (args.size() != 2) {
        return std::unexpected(arity_error(Function::Dot, "exactly 2 arguments", args.size()));
    }
    auto lhs = require_vector(Function::Dot, args, 0);
    if (!lhs) {
        return std::unexpected(lhs.error());
    }
    auto rhs = require_vector(Function::Dot, args, 1);
    if (!rhs) {
        return std::unexpected(rhs.error());
    }
    const Vector& a = **lhs;
    const Vector& b = **rhs;
    if (a.size() != b.size()) {
        return std::unexpected(make_error(
            ErrorKind::Shape,
            fmt::format("DOT() expects vectors of equal length, got {} and {}", a.size(),
                        b.size())));
    }
    double total = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        double product = a[i] * b[i];
        if (!std::isnan(product)) {
            total += product;
        }
    }
    return Value{total};
}

}  // namespace

auto all_functions() noexcept -> std::span<const FunctionInfo> {
    return kFunctions;
}

auto lookup_function(std::string_view name) noexcept -> std::optional<Function> {
    for (const auto& info : kFunctions) {
        if (info.name == name) {
            return info.id;
        }
    }
    return std::nullopt;
}

auto function_name(Function fn) noexcept -> std::string_view {
    for (const auto& info : kFunctions) {
        if (info.id == fn) {
            return info.name;
        }
    }
    return "<unknown>";
}

auto is_scenario_function(std::string_view name) noexcept -> bool {
    return iequals(name, "DOT") || iequals(name, "NORM");
}

auto is_aggregate_function(std::string_view name) noexcept -> bool {
    return name == "SUM" || name == "AVG" || name == "COUNT" || name == "MIN" || name == "MAX";
}

auto call_function(Function fn, std::span<const Value> args) -> std::expected<Value, FormulaError> {
    if (auto error = check_arity(fn, args.size())) {
        return std::unexpected(std::move(*error));
    }
    if (std::any_of(args.begin(), args.end(), [](const Value& v) { return is_null(v); })) {
        return Value{Null{}};
    }
    switch (fn) {
        case Function::Pow:
            return call_pow(args);
        case Function::Sqrt:
            return call_sqrt(args);
        case Function::Abs:
            return call_abs(args);
        case Function::Min:
            return call_extreme(fn, args, [](double a, double b) { return a < b; });
        case Function::Max:
            return call_extreme(fn, args, [](double a, double b) { return a > b; });
        case Function::Sum:
            return call_reduction(fn, args, [](const Vector& vec) { return vec.present_sum(); });
        case Function::Avg:
            return call_reduction(fn, args, [](const Vector& vec) {
                auto count = vec.present_count();
                return count == 0 ? 0.0 : vec.present_sum() / static_cast<double>(count);
            });
        case Function::Count:
            return call_reduction(
                fn, args, [](const Vector& vec) { return static_cast<double>(vec.size()); });
        case Function::ColumnMin:
            return call_reduction(fn, args,
                                  [](const Vector& vec) { return column_extreme(vec, false); });
        case Function::ColumnMax:
            return call_reduction(fn, args,
                                  [](const Vector& vec) { return column_extreme(vec, true); });
        case Function::Dot:
            return call_dot(args);
        case Function::Norm:
            return call_reduction(fn, args, [](const Vector& vec) {
                double squares = 0.0;
                vec.for_each_present([&](double element) { squares += element * element; });
                return std::sqrt(squares);
            });
    }
    return std::unexpected(make_error(ErrorKind::UnknownFunction, "unknown function"));
}

}  // namespace sphere::runtime
