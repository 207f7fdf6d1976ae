#pragma once

#include <sphere/compiler/compiler.hpp>
#include <sphere/core/error.hpp>
#include <sphere/core/formula_batch.hpp>

#include <expected>

namespace sphere::analysis {

struct Classification {
    /// Evaluated once per row.
    FormulaBatch row_formulas;
    /// Use DOT/NORM; evaluated once per batch over whole columns.
    FormulaBatch scenario_formulas;
};

/// Split a batch by uses_scenario_function(), keeping relative order. Any
/// formula that fails to compile fails the whole classification.
[[nodiscard]] auto classify(const FormulaBatch& batch, const Compiler& compiler)
    -> std::expected<Classification, FormulaError>;

}  // namespace sphere::analysis
