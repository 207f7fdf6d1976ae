#pragma once

#include <sphere/analysis/dependencies.hpp>
#include <sphere/compiler/formula.hpp>
#include <sphere/core/error.hpp>
#include <sphere/core/value.hpp>

#include <expected>
#include <set>
#include <span>
#include <vector>

namespace sphere::runtime {

/// Union of aggregate_dependencies() over several formulas.
[[nodiscard]] auto collect_aggregate_dependencies(std::span<const FormulaPtr> formulas)
    -> std::set<analysis::AggregateDependency>;

/// Gather one column across rows as a numeric vector. Cells that are not
/// numbers (Null, strings, vectors, or missing) become NaN; booleans are 0/1.
[[nodiscard]] auto gather_column(std::span<const Row> rows, const std::string& column) -> Vector;

/// Compute every dependency once over `rows`, keyed by aggregate_key().
///
/// Fails with UnknownVariable when a column appears in none of the rows.
[[nodiscard]] auto precompute_aggregates(std::span<const Row> rows,
                                         const std::set<analysis::AggregateDependency>& deps)
    -> std::expected<AggregateContext, FormulaError>;

}  // namespace sphere::runtime
