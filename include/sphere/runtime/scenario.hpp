#pragma once

#include <sphere/compiler/compiler.hpp>
#include <sphere/core/error.hpp>
#include <sphere/core/formula_batch.hpp>
#include <sphere/core/value.hpp>

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace sphere::runtime {

struct ExecutorOptions {
    /// Return the first error instead of recording it in its cell.
    bool fail_fast = false;
    /// Row count from which the row phases are split across threads.
    std::size_t parallel_row_threshold = 10'000;
    /// Compute SUM/AVG/COUNT/MIN/MAX over the input rows before running.
    bool precompute_aggregates = false;
};

using Cell = std::expected<Value, FormulaError>;

struct ResultColumn {
    std::string target;
    /// One cell per input row.
    std::vector<Cell> cells;
};

struct BatchResult {
    /// In batch insertion order.
    std::vector<ResultColumn> columns;

    [[nodiscard]] auto find(const std::string& target) const -> const ResultColumn*;
    [[nodiscard]] auto row_count() const noexcept -> std::size_t {
        return columns.empty() ? 0 : columns.front().cells.size();
    }
};

/// Runs a formula batch over rows in three phases.
///
/// 1. Row formulas, once per row, in batch order. Each result is added to
///    that row's copy so later formulas can read it.
/// 2. Scenario formulas (those calling DOT or NORM), once per batch. Their
///    free variables are vectors when the first computed row has a column of
///    that name, scalars from the first input row otherwise.
/// 3. Scenario results are added to every row and row formulas reading any
///    of them are evaluated again, once.
///
/// The input rows are never modified.
class ScenarioExecutor {
   public:
    explicit ScenarioExecutor(const Compiler& compiler, ExecutorOptions options = {});

    [[nodiscard]] auto execute(const FormulaBatch& batch, std::span<const Row> rows,
                               const AggregateContext* aggregates = nullptr) const
        -> std::expected<BatchResult, FormulaError>;

    [[nodiscard]] auto options() const noexcept -> const ExecutorOptions& { return options_; }

   private:
    const Compiler& compiler_;
    ExecutorOptions options_;
};

}  // namespace sphere::runtime
