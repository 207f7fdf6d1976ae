#include <sphere/analysis/classifier.hpp>
#include <sphere/analysis/dependencies.hpp>
#include <sphere/compiler/compiler.hpp>
#include <sphere/core/formula_batch.hpp>
#include <sphere/repl/repl.hpp>
#include <sphere/runtime/csv.hpp>
#include <sphere/runtime/evaluator.hpp>
#include <sphere/runtime/scenario.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#ifdef SPHERE_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace sphere::repl {

namespace {

#ifdef SPHERE_HAS_READLINE
constexpr std::array<std::string_view, 14> kColonCommands = {
    ":q",    ":quit",     ":exit", ":load", ":rows",   ":formulas",   ":clear",
    ":deps", ":classify", ":run",  ":time", ":timing", ":aggregates", ":help",
};

auto colon_command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kColonCommands.size()) {
        const auto command = kColonCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr || text[0] != ':') {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, colon_command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

auto trim(std::string_view text) -> std::string_view {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

auto starts_with_command(std::string_view text, std::string_view command) -> bool {
    if (!text.starts_with(command)) {
        return false;
    }
    if (text.size() == command.size()) {
        return true;
    }
    auto next = static_cast<unsigned char>(text[command.size()]);
    return std::isspace(next) != 0;
}

auto command_argument(std::string_view text, std::string_view command) -> std::string_view {
    return trim(text.substr(command.size()));
}

auto parse_load_path(std::string_view text) -> std::string {
    std::string_view view = trim(text);
    if (view.empty()) {
        return {};
    }
    if (view.front() == '"' || view.front() == '\'') {
        char quote = view.front();
        auto end = view.find(quote, 1);
        if (end != std::string_view::npos) {
            return std::string(view.substr(1, end - 1));
        }
    }
    return std::string(view);
}

auto parse_optional_size(std::string_view text, std::size_t default_value) -> std::size_t {
    text = trim(text);
    if (text.empty()) {
        return default_value;
    }
    std::size_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc()) {
        return default_value;
    }
    return value;
}

auto is_identifier(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(text.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    return std::ranges::all_of(text, [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) != 0 || c == '_';
    });
}

void print_elapsed(std::chrono::steady_clock::duration elapsed) {
    using namespace std::chrono;
    auto micros = duration_cast<microseconds>(elapsed).count();
    if (micros < 1000) {
        fmt::print("time: {} us\n", micros);
        return;
    }
    if (micros < 1000 * 1000) {
        fmt::print("time: {:.3f} ms\n", static_cast<double>(micros) / 1000.0);
        return;
    }
    fmt::print("time: {:.3f} s\n", static_cast<double>(micros) / 1'000'000.0);
}

/// Column-major text grid printed as an ASCII table.
struct TextTable {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> cells;
    std::size_t total_rows = 0;
};

void print_table(const TextTable& table) {
    if (table.headers.empty()) {
        fmt::print("<empty>\n");
        return;
    }
    fmt::print("rows: {}\n", table.total_rows);

    const std::size_t col_count = table.headers.size();
    const std::size_t shown_rows = table.cells.front().size();

    std::vector<std::size_t> widths(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = table.headers[c].size();
        for (const auto& cell : table.cells[c]) {
            widths[c] = std::max(widths[c], cell.size());
        }
    }

    auto print_sep = [&]() {
        fmt::print("+");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::print("{:-<{}}+", "", widths[c] + 2);
        }
        fmt::print("\n");
    };

    print_sep();
    fmt::print("|");
    for (std::size_t c = 0; c < col_count; ++c) {
        fmt::print(" {:<{}} |", table.headers[c], widths[c]);
    }
    fmt::print("\n");
    print_sep();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        fmt::print("|");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::print(" {:<{}} |", table.cells[c][r], widths[c]);
        }
        fmt::print("\n");
    }
    print_sep();

    if (table.total_rows > shown_rows) {
        fmt::print("... ({} more rows)\n", table.total_rows - shown_rows);
    }
}

/// Input column names, sorted, across all rows.
auto column_names(std::span<const Row> rows) -> std::vector<std::string> {
    std::set<std::string> names;
    for (const auto& row : rows) {
        for (const auto& [name, value] : row) {
            names.insert(name);
        }
    }
    return {names.begin(), names.end()};
}

auto input_table(std::span<const Row> rows, std::size_t max_rows) -> TextTable {
    TextTable table;
    table.headers = column_names(rows);
    table.total_rows = rows.size();
    const std::size_t shown = std::min(rows.size(), max_rows);
    table.cells.resize(table.headers.size());
    for (std::size_t c = 0; c < table.headers.size(); ++c) {
        table.cells[c].reserve(shown);
        for (std::size_t r = 0; r < shown; ++r) {
            auto it = rows[r].find(table.headers[c]);
            table.cells[c].push_back(it == rows[r].end() ? "" : format_value(it->second));
        }
    }
    return table;
}

enum class Outcome { Ok, Error, Quit };

class Session {
   public:
    explicit Session(const ReplConfig& config)
        : compiler_(CompilerOptions{.cache_capacity = config.cache_capacity}) {
        options_.parallel_row_threshold = config.parallel_row_threshold;
    }

    auto handle(std::string_view line) -> Outcome {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            return Outcome::Ok;
        }

        if (starts_with_command(line, ":timing")) {
            auto arg = command_argument(line, ":timing");
            if (arg.empty()) {
                timing_enabled_ = !timing_enabled_;
            } else if (arg == "on") {
                timing_enabled_ = true;
            } else if (arg == "off") {
                timing_enabled_ = false;
            } else {
                fmt::print("usage: :timing [on|off]\n");
                return Outcome::Error;
            }
            fmt::print("timing: {}\n", timing_enabled_ ? "on" : "off");
            return Outcome::Ok;
        }

        bool one_shot_timing = false;
        if (starts_with_command(line, ":time")) {
            line = command_argument(line, ":time");
            if (line.empty()) {
                fmt::print("usage: :time <command>\n");
                return Outcome::Error;
            }
            one_shot_timing = true;
        }

        std::optional<std::chrono::steady_clock::time_point> timing_start;
        if (timing_enabled_ || one_shot_timing) {
            timing_start = std::chrono::steady_clock::now();
        }
        auto outcome = dispatch(line);
        if (timing_start.has_value() && outcome != Outcome::Quit) {
            print_elapsed(std::chrono::steady_clock::now() - *timing_start);
        }
        return outcome;
    }

   private:
    auto dispatch(std::string_view line) -> Outcome {
        if (line == ":q" || line == ":quit" || line == ":exit") {
            return Outcome::Quit;
        }
        if (line == ":help") {
            print_help();
            return Outcome::Ok;
        }
        if (starts_with_command(line, ":load")) {
            return load(command_argument(line, ":load"));
        }
        if (starts_with_command(line, ":rows")) {
            auto count = parse_optional_size(command_argument(line, ":rows"), 10);
            print_table(input_table(rows_, count));
            return Outcome::Ok;
        }
        if (line == ":formulas") {
            if (batch_.empty()) {
                fmt::print("formulas: <none>\n");
            }
            for (const auto& entry : batch_) {
                fmt::print("  {} = {}\n", entry.target, entry.text);
            }
            return Outcome::Ok;
        }
        if (line == ":clear") {
            batch_.clear();
            fmt::print("formulas cleared\n");
            return Outcome::Ok;
        }
        if (starts_with_command(line, ":aggregates")) {
            auto arg = command_argument(line, ":aggregates");
            if (arg.empty()) {
                options_.precompute_aggregates = !options_.precompute_aggregates;
            } else if (arg == "on" || arg == "off") {
                options_.precompute_aggregates = arg == "on";
            } else {
                fmt::print("usage: :aggregates [on|off]\n");
                return Outcome::Error;
            }
            fmt::print("aggregates: {}\n", options_.precompute_aggregates ? "on" : "off");
            return Outcome::Ok;
        }
        if (starts_with_command(line, ":deps")) {
            return deps(command_argument(line, ":deps"));
        }
        if (line == ":classify") {
            return classify();
        }
        if (starts_with_command(line, ":run")) {
            return run_batch(parse_optional_size(command_argument(line, ":run"), 10));
        }
        if (line.front() == ':') {
            fmt::print("error: unknown command '{}' (try :help)\n", line);
            return Outcome::Error;
        }
        if (auto assignment = split_assignment(line)) {
            auto compiled = compiler_.compile(assignment->second);
            if (!compiled) {
                fmt::print("error: {}\n", compiled.error().format());
                return Outcome::Error;
            }
            batch_.insert_or_assign(std::move(assignment->first), std::move(assignment->second));
            return Outcome::Ok;
        }
        return evaluate_line(line);
    }

    auto load(std::string_view arg) -> Outcome {
        auto path = parse_load_path(arg);
        if (path.empty()) {
            fmt::print("usage: :load <csv>\n");
            return Outcome::Error;
        }
        auto rows = runtime::read_csv_rows(path);
        if (!rows) {
            fmt::print("error: {}\n", rows.error());
            return Outcome::Error;
        }
        rows_ = std::move(*rows);
        fmt::print("loaded {} rows from {}\n", rows_.size(), path);
        return Outcome::Ok;
    }

    auto deps(std::string_view text) -> Outcome {
        if (text.empty()) {
            fmt::print("usage: :deps <formula>\n");
            return Outcome::Error;
        }
        auto compiled = compiler_.compile(text);
        if (!compiled) {
            fmt::print("error: {}\n", compiled.error().format());
            return Outcome::Error;
        }
        const auto& formula = **compiled;
        std::string names;
        for (const auto& name : analysis::free_identifiers(formula)) {
            names += names.empty() ? name : ", " + name;
        }
        fmt::print("identifiers: {}\n", names.empty() ? "<none>" : names);
        auto aggregates = analysis::aggregate_dependencies(formula);
        if (aggregates.empty()) {
            fmt::print("aggregates: <none>\n");
        } else {
            fmt::print("aggregates:\n");
            for (const auto& dep : aggregates) {
                fmt::print("  {}({}) -> {}\n", dep.function, dep.column,
                           analysis::aggregate_key(dep));
            }
        }
        fmt::print("level: {}\n", analysis::uses_scenario_function(formula) ? "scenario" : "row");
        return Outcome::Ok;
    }

    auto classify() -> Outcome {
        auto result = analysis::classify(batch_, compiler_);
        if (!result) {
            fmt::print("error: {}\n", result.error().format());
            return Outcome::Error;
        }
        auto print_group = [](std::string_view label, const FormulaBatch& group) {
            fmt::print("{}:", label);
            if (group.empty()) {
                fmt::print(" <none>");
            }
            for (const auto& entry : group) {
                fmt::print(" {}", entry.target);
            }
            fmt::print("\n");
        };
        print_group("row", result->row_formulas);
        print_group("scenario", result->scenario_formulas);
        return Outcome::Ok;
    }

    auto run_batch(std::size_t max_rows) -> Outcome {
        if (batch_.empty()) {
            fmt::print("error: no formulas (declare with target = formula)\n");
            return Outcome::Error;
        }
        runtime::ScenarioExecutor executor(compiler_, options_);
        auto result = executor.execute(batch_, rows_);
        if (!result) {
            fmt::print("error: {}\n", result.error().format());
            return Outcome::Error;
        }

        print_batch_result(rows_, *result, max_rows);
        return Outcome::Ok;
    }

    auto evaluate_line(std::string_view text) -> Outcome {
        static const Row kEmptyRow;
        const Row& row = rows_.empty() ? kEmptyRow : rows_.front();
        auto value = runtime::run_formula(compiler_, text, row);
        if (!value) {
            fmt::print("error: {}\n", value.error().format());
            return Outcome::Error;
        }
        fmt::print("{}\n", format_value(*value));
        return Outcome::Ok;
    }

    static void print_help() {
        fmt::print(
            "  :load <csv>          load rows from a CSV file\n"
            "  :rows [n]            show the loaded rows\n"
            "  target = formula     add or replace a formula in the batch\n"
            "  :formulas            list the batch\n"
            "  :clear               drop every formula\n"
            "  :deps <formula>      show identifiers and aggregates a formula reads\n"
            "  :classify            split the batch into row and scenario formulas\n"
            "  :run [n]             execute the batch over the loaded rows\n"
            "  :aggregates [on|off] precompute SUM/AVG/COUNT/MIN/MAX before :run\n"
            "  :time <command>      time one command\n"
            "  :timing [on|off]     time every command\n"
            "  :q                   quit\n"
            "anything else is evaluated against the first loaded row\n");
    }

    Compiler compiler_;
    runtime::ExecutorOptions options_;
    std::vector<Row> rows_;
    FormulaBatch batch_;
    bool timing_enabled_ = false;
};

}  // namespace

void print_batch_result(std::span<const Row> rows, const runtime::BatchResult& result,
                        std::size_t max_rows) {
    auto table = input_table(rows, max_rows);
    const std::size_t shown = std::min(rows.size(), max_rows);
    std::vector<std::string> failures;
    for (const auto& column : result.columns) {
        std::vector<std::string> cells;
        cells.reserve(shown);
        std::optional<std::string> first_error;
        for (std::size_t r = 0; r < column.cells.size(); ++r) {
            const auto& cell = column.cells[r];
            if (!cell && !first_error.has_value()) {
                first_error = cell.error().format();
            }
            if (r < shown) {
                cells.push_back(cell ? format_value(*cell)
                                     : fmt::format("!{}", error_kind_name(cell.error().kind)));
            }
        }
        if (first_error.has_value()) {
            failures.push_back(fmt::format("{}: {}", column.target, *first_error));
        }
        table.headers.push_back(column.target);
        table.cells.push_back(std::move(cells));
    }
    print_table(table);
    for (const auto& failure : failures) {
        fmt::print("error: {}\n", failure);
    }
}

auto split_assignment(std::string_view line) -> std::optional<std::pair<std::string, std::string>> {
    auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }
    if (eq + 1 < line.size() && line[eq + 1] == '=') {
        return std::nullopt;
    }
    auto target = trim(line.substr(0, eq));
    auto formula = trim(line.substr(eq + 1));
    if (!is_identifier(target) || formula.empty()) {
        return std::nullopt;
    }
    return std::pair{std::string(target), std::string(formula)};
}

auto execute_script(std::string_view source, const ReplConfig& config) -> bool {
    Session session(config);
    bool ok = true;
    while (!source.empty()) {
        auto newline = source.find('\n');
        auto line = source.substr(0, newline);
        source =
            newline == std::string_view::npos ? std::string_view{} : source.substr(newline + 1);
        auto outcome = session.handle(line);
        if (outcome == Outcome::Quit) {
            break;
        }
        if (outcome == Outcome::Error) {
            ok = false;
        }
    }
    return ok;
}

void run(const ReplConfig& config) {
    if (config.verbose) {
        spdlog::info("Sphere REPL started (verbose={})", config.verbose);
    }

    Session session(config);
    configure_line_editing();

    std::string line;
    while (true) {
        if (!read_repl_line(config.prompt, line)) {
            fmt::print("\n");
            break;
        }
        if (session.handle(line) == Outcome::Quit) {
            break;
        }
    }

    spdlog::info("Sphere REPL exiting");
}

}  // namespace sphere::repl
