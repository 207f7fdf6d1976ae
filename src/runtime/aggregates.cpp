#include <sphere/runtime/aggregates.hpp>
#include <sphere/runtime/functions.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <limits>
#include <optional>

namespace sphere::runtime {

auto collect_aggregate_dependencies(std::span<const FormulaPtr> formulas)
    -> std::set<analysis::AggregateDependency> {
    std::set<analysis::AggregateDependency> deps;
    for (const auto& formula : formulas) {
        auto found = analysis::aggregate_dependencies(*formula);
        deps.insert(found.begin(), found.end());
    }
    return deps;
}

auto gather_column(std::span<const Row> rows, const std::string& column) -> Vector {
    Vector out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        auto it = row.find(column);
        std::optional<double> number;
        if (it != row.end()) {
            number = as_number(it->second);
        }
        out.push_back(number.value_or(std::numeric_limits<double>::quiet_NaN()));
    }
    return out;
}

auto precompute_aggregates(std::span<const Row> rows,
                           const std::set<analysis::AggregateDependency>& deps)
    -> std::expected<AggregateContext, FormulaError> {
    AggregateContext context;
    for (const auto& dep : deps) {
        const bool present = std::ranges::any_of(
            rows, [&](const Row& row) { return row.contains(dep.column); });
        if (!present) {
            return std::unexpected(make_error(
                ErrorKind::UnknownVariable,
                fmt::format("aggregate column '{}' not found in any row", dep.column)));
        }
        auto fn = lookup_function(dep.function);
        if (!fn.has_value() || !is_aggregate_function(dep.function)) {
            return std::unexpected(make_error(
                ErrorKind::UnknownFunction,
                fmt::format("'{}' is not an aggregate function", dep.function)));
        }
        std::array<Value, 1> args{Value{gather_column(rows, dep.column)}};
        auto value = call_function(*fn, args);
        if (!value) {
            return std::unexpected(value.error());
        }
        context.insert_or_assign(analysis::aggregate_key(dep), std::move(*value));
    }
    spdlog::debug("precomputed {} aggregate(s) over {} row(s)", context.size(), rows.size());
    return context;
}

}  // namespace sphere::runtime
