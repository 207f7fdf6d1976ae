#pragma once

#include <sphere/compiler/formula.hpp>
#include <sphere/parser/ast.hpp>

#include <compare>
#include <set>
#include <string>

namespace sphere::analysis {

/// A column aggregate a formula needs, e.g. SUM over `sales`.
struct AggregateDependency {
    std::string function;
    std::string column;

    auto operator<=>(const AggregateDependency&) const = default;
};

/// Every variable the expression reads, excluding names of callable
/// functions.
[[nodiscard]] auto free_identifiers(const parser::Expr& expr) -> std::set<std::string>;
[[nodiscard]] auto free_identifiers(const CompiledFormula& formula) -> std::set<std::string>;

/// Calls of SUM/AVG/COUNT/MIN/MAX whose only argument is a bare variable.
[[nodiscard]] auto aggregate_dependencies(const parser::Expr& expr)
    -> std::set<AggregateDependency>;
[[nodiscard]] auto aggregate_dependencies(const CompiledFormula& formula)
    -> std::set<AggregateDependency>;

/// Key under which a precomputed aggregate is looked up: "SUM_sales".
[[nodiscard]] auto aggregate_key(const AggregateDependency& dependency) -> std::string;

/// True iff the expression calls DOT or NORM (case-insensitive).
[[nodiscard]] auto uses_scenario_function(const parser::Expr& expr) -> bool;
[[nodiscard]] auto uses_scenario_function(const CompiledFormula& formula) -> bool;

}  // namespace sphere::analysis
