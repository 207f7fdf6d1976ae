#include <sphere/analysis/dependencies.hpp>
#include <sphere/runtime/aggregates.hpp>
#include <sphere/runtime/evaluator.hpp>
#include <sphere/runtime/scenario.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <set>
#include <thread>
#include <utility>

namespace sphere::runtime {

auto BatchResult::find(const std::string& target) const -> const ResultColumn* {
    auto it = std::ranges::find_if(columns,
                                   [&](const ResultColumn& col) { return col.target == target; });
    return it == columns.end() ? nullptr : &*it;
}

namespace {

struct PreparedFormula {
    std::string target;
    std::string text;
    FormulaPtr formula;
    std::optional<FormulaError> compile_error;
    bool scenario = false;
    std::set<std::string> reads;
};

/// Call fn(row_index) for every row, splitting into contiguous chunks over
/// worker threads once `rows` reaches `threshold`.
template <typename Fn>
void for_each_row(std::size_t rows, std::size_t threshold, Fn fn) {
    const bool use_parallel =
        threshold > 0 && rows >= threshold && std::thread::hardware_concurrency() > 1;
    if (!use_parallel) {
        for (std::size_t r = 0; r < rows; ++r) {
            fn(r);
        }
        return;
    }
    const std::size_t hw = std::max<unsigned>(1, std::thread::hardware_concurrency());
    const std::size_t threads = std::min(rows, hw);
    const std::size_t chunk = (rows + threads - 1) / threads;
    spdlog::debug("splitting {} rows over {} threads ({} rows each)", rows, threads, chunk);
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        std::size_t start = t * chunk;
        if (start >= rows) {
            break;
        }
        std::size_t end = std::min(rows, start + chunk);
        workers.emplace_back([&fn, start, end] {
            for (std::size_t r = start; r < end; ++r) {
                fn(r);
            }
        });
    }
    for (auto& th : workers) {
        th.join();
    }
}

auto intersects(const std::set<std::string>& lhs, const std::set<std::string>& rhs) -> bool {
    return std::ranges::any_of(lhs, [&](const std::string& name) { return rhs.contains(name); });
}

}  // namespace

ScenarioExecutor::ScenarioExecutor(const Compiler& compiler, ExecutorOptions options)
    : compiler_(compiler), options_(options) {}

auto ScenarioExecutor::execute(const FormulaBatch& batch, std::span<const Row> rows,
                               const AggregateContext* aggregates) const
    -> std::expected<BatchResult, FormulaError> {
    const std::size_t n_rows = rows.size();
    BatchResult result;
    if (batch.empty()) {
        return result;
    }

    // Compile once per formula and classify.
    std::vector<PreparedFormula> prepared;
    prepared.reserve(batch.size());
    std::vector<FormulaPtr> compiled;
    for (const auto& entry : batch) {
        PreparedFormula item{.target = entry.target, .text = entry.text};
        auto formula = compiler_.compile(entry.text);
        if (!formula) {
            if (options_.fail_fast) {
                return std::unexpected(formula.error());
            }
            item.compile_error = formula.error();
        } else {
            item.formula = *formula;
            item.scenario = analysis::uses_scenario_function(**formula);
            item.reads = analysis::free_identifiers(**formula);
            compiled.push_back(item.formula);
        }
        prepared.push_back(std::move(item));
    }

    // Aggregate overlay: caller-supplied entries win over precomputed ones.
    AggregateContext overlay;
    const AggregateContext* agg = aggregates;
    if (options_.precompute_aggregates) {
        for (const auto& dep : collect_aggregate_dependencies(compiled)) {
            auto value = precompute_aggregates(rows, {dep});
            if (!value) {
                if (options_.fail_fast) {
                    return std::unexpected(value.error());
                }
                spdlog::debug("skipping aggregate {}: {}", analysis::aggregate_key(dep),
                              value.error().message);
                continue;
            }
            overlay.merge(*value);
        }
        if (aggregates != nullptr) {
            for (const auto& [key, value] : *aggregates) {
                overlay.insert_or_assign(key, value);
            }
        }
        agg = &overlay;
    }

    std::vector<std::size_t> row_idx;
    std::vector<std::size_t> scenario_idx;
    for (std::size_t i = 0; i < prepared.size(); ++i) {
        if (prepared[i].compile_error.has_value()) {
            continue;
        }
        (prepared[i].scenario ? scenario_idx : row_idx).push_back(i);
    }
    spdlog::debug("executing {} row formula(s), {} scenario formula(s) over {} row(s)",
                  row_idx.size(), scenario_idx.size(), n_rows);

    // cells[i][r] for formula i, row r.
    std::vector<std::vector<Cell>> cells(prepared.size());
    for (std::size_t i = 0; i < prepared.size(); ++i) {
        if (prepared[i].compile_error.has_value()) {
            cells[i].assign(n_rows, std::unexpected(*prepared[i].compile_error));
        } else {
            cells[i].resize(n_rows, Value{Null{}});
        }
    }

    std::vector<Row> computed(rows.begin(), rows.end());

    auto run_row_formulas = [&](std::size_t r, const std::vector<std::size_t>& which) {
        for (auto i : which) {
            const auto& item = prepared[i];
            auto value = evaluate(*item.formula, computed[r], agg);
            if (value) {
                computed[r].insert_or_assign(item.target, *value);
            }
            cells[i][r] = std::move(value);
        }
    };

    // First failing cell in row order, then batch order.
    auto first_error = [&](const std::vector<std::size_t>& which) -> std::optional<FormulaError> {
        for (std::size_t r = 0; r < n_rows; ++r) {
            for (auto i : which) {
                if (!cells[i][r]) {
                    return cells[i][r].error();
                }
            }
        }
        return std::nullopt;
    };

    // Row formulas reading a scenario target are settled in phase 3.
    std::set<std::string> scenario_targets;
    for (auto i : scenario_idx) {
        scenario_targets.insert(prepared[i].target);
    }
    std::vector<std::size_t> settled_in_phase1;
    for (auto i : row_idx) {
        if (!intersects(prepared[i].reads, scenario_targets)) {
            settled_in_phase1.push_back(i);
        }
    }

    // Phase 1: row formulas.
    for_each_row(n_rows, options_.parallel_row_threshold,
                 [&](std::size_t r) { run_row_formulas(r, row_idx); });
    if (options_.fail_fast) {
        if (auto error = first_error(settled_in_phase1)) {
            return std::unexpected(std::move(*error));
        }
    }

    if (!scenario_idx.empty()) {
        // Phase 2: assemble the scenario context and evaluate sequentially.
        std::set<std::string> needed;
        for (auto i : scenario_idx) {
            needed.insert(prepared[i].reads.begin(), prepared[i].reads.end());
        }
        Row context;
        std::size_t vectors = 0;
        for (const auto& name : needed) {
            if (!computed.empty() && computed.front().contains(name)) {
                context.insert_or_assign(name, Value{gather_column(computed, name)});
                ++vectors;
            } else if (!rows.empty()) {
                if (auto it = rows.front().find(name); it != rows.front().end()) {
                    context.insert_or_assign(name, it->second);
                }
            } else if (agg == nullptr || !agg->contains(name)) {
                // No rows: every column is an empty vector.
                context.insert_or_assign(name, Value{Vector{}});
                ++vectors;
            }
        }
        spdlog::debug("scenario context: {} vector(s), {} other name(s)", vectors,
                      needed.size() - vectors);

        std::set<std::string> produced;
        for (auto i : scenario_idx) {
            const auto& item = prepared[i];
            auto value = evaluate(*item.formula, context, agg);
            if (!value && options_.fail_fast) {
                return std::unexpected(value.error());
            }
            if (value) {
                context.insert_or_assign(item.target, *value);
                produced.insert(item.target);
            }
            cells[i].assign(n_rows, value);
        }

        // Phase 3: push scenario results into rows and refresh dependents.
        std::vector<std::size_t> dependents;
        for (auto i : row_idx) {
            if (intersects(prepared[i].reads, produced)) {
                dependents.push_back(i);
            }
        }
        spdlog::debug("back-propagating {} scenario result(s) to {} row formula(s)",
                      produced.size(), dependents.size());
        if (!produced.empty()) {
            for_each_row(n_rows, options_.parallel_row_threshold, [&](std::size_t r) {
                for (const auto& name : produced) {
                    computed[r].insert_or_assign(name, context.at(name));
                }
                run_row_formulas(r, dependents);
            });
            if (options_.fail_fast) {
                if (auto error = first_error(dependents)) {
                    return std::unexpected(std::move(*error));
                }
            }
        }
    }

    result.columns.reserve(prepared.size());
    for (std::size_t i = 0; i < prepared.size(); ++i) {
        result.columns.push_back(
            ResultColumn{.target = prepared[i].target, .cells = std::move(cells[i])});
    }
    return result;
}

}  // namespace sphere::runtime
