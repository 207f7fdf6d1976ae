#include <sphere/compiler/compiler.hpp>
#include <sphere/core/formula_batch.hpp>
#include <sphere/repl/repl.hpp>
#include <sphere/runtime/csv.hpp>
#include <sphere/runtime/scenario.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace {

auto env_size(const char* name, std::size_t default_value) -> std::size_t {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return default_value;
    }
    std::string_view text(env);
    std::size_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        spdlog::warn("ignoring {}={}: not a count", name, text);
        return default_value;
    }
    return value;
}

/// "TARGET:FORMULA" -> batch entry. The first ':' separates the two.
auto add_assignment(sphere::FormulaBatch& batch, std::string_view assignment) -> bool {
    auto colon = assignment.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == assignment.size()) {
        fmt::print("error: expected TARGET:FORMULA, got '{}'\n", assignment);
        return false;
    }
    batch.insert_or_assign(std::string(assignment.substr(0, colon)),
                           std::string(assignment.substr(colon + 1)));
    return true;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"Sphere: evaluate a formula batch over CSV rows"};

    std::string csv_path;
    std::vector<std::string> assignments;
    bool verbose = false;
    std::size_t cache_capacity =
        env_size("SPHERE_CACHE_CAPACITY", sphere::FormulaCache::kDefaultCapacity);
    std::size_t max_rows = 20;
    sphere::runtime::ExecutorOptions options;

    app.add_option("--csv", csv_path, "CSV file with one row per record")->required();
    app.add_option("formulas", assignments, "TARGET:FORMULA, evaluated in the order given")
        ->required();
    app.add_flag("--aggregates", options.precompute_aggregates,
                 "Precompute SUM/AVG/COUNT/MIN/MAX of input columns as FUNC_column");
    app.add_flag("--fail-fast", options.fail_fast, "Stop at the first formula error");
    app.add_option("--cache-capacity", cache_capacity,
                   "Compiled formulas kept in the cache (0 disables caching). "
                   "Defaults to SPHERE_CACHE_CAPACITY, then 1024.");
    app.add_option("--parallel-threshold", options.parallel_row_threshold,
                   "Row count from which rows are evaluated on several threads");
    app.add_option("--max-rows", max_rows, "Rows to print");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    sphere::FormulaBatch batch;
    for (const auto& assignment : assignments) {
        if (!add_assignment(batch, assignment)) {
            return 1;
        }
    }

    auto rows = sphere::runtime::read_csv_rows(csv_path);
    if (!rows) {
        fmt::print("error: {}\n", rows.error());
        return 1;
    }
    spdlog::info("loaded {} rows from {}", rows->size(), csv_path);

    sphere::Compiler compiler(sphere::CompilerOptions{.cache_capacity = cache_capacity});
    sphere::runtime::ScenarioExecutor executor(compiler, options);

    auto start = std::chrono::steady_clock::now();
    auto result = executor.execute(batch, *rows);
    auto end = std::chrono::steady_clock::now();
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return 1;
    }
    spdlog::debug("batch of {} formula(s) took {:.3f} ms", batch.size(),
                  std::chrono::duration<double, std::milli>(end - start).count());

    sphere::repl::print_batch_result(*rows, *result, max_rows);
    return 0;
}
