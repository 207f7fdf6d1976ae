#pragma once

#include <sphere/compiler/compiler.hpp>
#include <sphere/core/error.hpp>
#include <sphere/core/value.hpp>
#include <sphere/parser/ast.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace sphere::runtime {

/// Variable lookup over a row, with an optional aggregate context consulted
/// only for names the row does not define.
class Environment {
   public:
    explicit Environment(const Row& row, const AggregateContext* aggregates = nullptr) noexcept
        : row_(&row), aggregates_(aggregates) {}

    [[nodiscard]] auto find(const std::string& name) const -> const Value*;

   private:
    const Row* row_;
    const AggregateContext* aggregates_;
};

using EvalResult = std::expected<Value, FormulaError>;

/// Evaluate an expression tree. Pure: the environment is never modified.
[[nodiscard]] auto evaluate(const parser::Expr& expr, const Environment& env) -> EvalResult;

/// Evaluate a compiled formula; errors carry the formula text.
[[nodiscard]] auto evaluate(const CompiledFormula& formula, const Row& row,
                            const AggregateContext* aggregates = nullptr) -> EvalResult;

/// Compile (through the compiler's cache) and evaluate in one step.
[[nodiscard]] auto run_formula(const Compiler& compiler, std::string_view text, const Row& row)
    -> EvalResult;

/// As run_formula(), with precomputed aggregates overlaid under the row.
[[nodiscard]] auto run_formula_with_aggregates(const Compiler& compiler, std::string_view text,
                                               const Row& row, const AggregateContext& aggregates)
    -> EvalResult;

}  // namespace sphere::runtime
