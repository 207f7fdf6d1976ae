#include <sphere/compiler/compiler.hpp>
#include <sphere/runtime/evaluator.hpp>
#include <sphere/runtime/scenario.hpp>

#include <fmt/core.h>

#include <vector>

auto main() -> int {
    sphere::Compiler compiler;

    // Single formula against one row
    fmt::print("=== Single formula ===\n");
    sphere::Row row{{"price", 10.0}, {"qty", 3.0}};
    auto revenue = sphere::runtime::run_formula(compiler, "price * qty", row);
    if (!revenue) {
        fmt::print("error: {}\n", revenue.error().format());
        return 1;
    }
    fmt::print("price * qty = {}\n", sphere::format_value(*revenue));

    // Batch over rows: one row formula, one scenario formula, one dependent
    fmt::print("\n=== Scenario batch ===\n");
    std::vector<sphere::Row> rows{
        {{"price", 10.0}, {"qty", 2.0}},
        {{"price", 20.0}, {"qty", 1.0}},
    };
    sphere::FormulaBatch batch{
        {"rev", "price * qty"},
        {"total", "DOT(price, qty)"},
        {"share", "rev / total"},
    };

    sphere::runtime::ScenarioExecutor executor(compiler);
    auto result = executor.execute(batch, rows);
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return 1;
    }
    for (const auto& column : result->columns) {
        fmt::print("{}:", column.target);
        for (const auto& cell : column.cells) {
            fmt::print(" {}", cell ? sphere::format_value(*cell) : cell.error().format());
        }
        fmt::print("\n");
    }

    fmt::print("\ncache: {} formulas, {} hits, {} misses\n", compiler.cache().size(),
               compiler.cache().hits(), compiler.cache().misses());
    return 0;
}
