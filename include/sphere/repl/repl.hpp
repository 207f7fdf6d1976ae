#pragma once

#include <sphere/compiler/formula_cache.hpp>
#include <sphere/core/value.hpp>
#include <sphere/runtime/scenario.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace sphere::repl {

/// Configuration for the REPL session.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = "sphere> ";
    std::size_t cache_capacity = FormulaCache::kDefaultCapacity;
    /// Rows from which the batch runs in parallel.
    std::size_t parallel_row_threshold = 10'000;
};

/// Run the interactive REPL loop.
///
/// Reads lines from stdin until EOF or `:q`.
void run(const ReplConfig& config);

/// Execute newline-separated REPL input in a fresh session (useful for tests).
/// Returns false if any line reported an error.
[[nodiscard]] auto execute_script(std::string_view source, const ReplConfig& config = {})
    -> bool;

/// Print the input rows followed by one column per batch target, at most
/// `max_rows` rows. Failed cells show their error kind; the first error of
/// each target is listed below the table.
void print_batch_result(std::span<const Row> rows, const runtime::BatchResult& result,
                        std::size_t max_rows = 10);

/// Split `target = formula` into its parts. Comparisons such as `a == b` or
/// `a <= b` are not assignments.
[[nodiscard]] auto split_assignment(std::string_view line)
    -> std::optional<std::pair<std::string, std::string>>;

}  // namespace sphere::repl
