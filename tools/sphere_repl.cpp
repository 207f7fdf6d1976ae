#include <sphere/repl/repl.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <string_view>

auto main(int argc, char** argv) -> int {
    CLI::App app{"Sphere: interactive formula shell"};

    bool verbose = false;
    sphere::repl::ReplConfig config;
    // SPHERE_CACHE_CAPACITY sets the default; --cache-capacity overrides it.
    if (const char* env = std::getenv("SPHERE_CACHE_CAPACITY"); env != nullptr) {
        std::string_view text(env);
        std::size_t value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec == std::errc() && result.ptr == text.data() + text.size()) {
            config.cache_capacity = value;
        }
    }
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("--cache-capacity", config.cache_capacity,
                   "Compiled formulas kept in the cache (0 disables caching). "
                   "Defaults to SPHERE_CACHE_CAPACITY, then 1024.");
    app.add_option("--parallel-threshold", config.parallel_row_threshold,
                   "Row count from which :run evaluates rows on several threads");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    config.verbose = verbose;

    sphere::repl::run(config);

    return 0;
}
