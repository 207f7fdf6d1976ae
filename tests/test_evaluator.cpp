#include <sphere/compiler/compiler.hpp>
#include <sphere/runtime/evaluator.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>

using sphere::ErrorKind;
using sphere::Row;
using sphere::Value;
using sphere::Vector;
using sphere::runtime::EvalResult;
using sphere::runtime::run_formula;

namespace {

auto eval(const char* text, const Row& row = {}) -> EvalResult {
    static sphere::Compiler compiler;
    return run_formula(compiler, text, row);
}

auto number(const char* text, const Row& row = {}) -> double {
    auto result = eval(text, row);
    INFO(text);
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<double>(*result));
    return std::get<double>(*result);
}

auto boolean(const char* text, const Row& row = {}) -> bool {
    auto result = eval(text, row);
    INFO(text);
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<bool>(*result));
    return std::get<bool>(*result);
}

auto error_kind(const char* text, const Row& row = {}) -> ErrorKind {
    auto result = eval(text, row);
    INFO(text);
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
}

}  // namespace

TEST_CASE("Arithmetic on scalars", "[evaluator]") {
    REQUIRE(number("1 + 2 * 3") == 7.0);
    REQUIRE(number("(1 + 2) * 3") == 9.0);
    REQUIRE(number("7 / 2") == 3.5);
    REQUIRE(number("2 ** 10") == 1024.0);
    REQUIRE(number("-2 ** 2") == -4.0);
    REQUIRE(number("2 ** 3 ** 2") == 512.0);
    REQUIRE(number("-(3 - 5)") == 2.0);
    REQUIRE(number("0.1 + 0.2") == Catch::Approx(0.3));
}

TEST_CASE("Division by zero follows IEEE", "[evaluator]") {
    REQUIRE(std::isinf(number("1 / 0")));
    REQUIRE(number("-1 / 0") < 0.0);
    REQUIRE(std::isnan(number("0 / 0")));
}

TEST_CASE("Booleans count as 0 and 1", "[evaluator]") {
    REQUIRE(number("True + True") == 2.0);
    REQUIRE(number("flag * 10", Row{{"flag", true}}) == 10.0);
}

TEST_CASE("Variables come from the row before the aggregates", "[evaluator]") {
    sphere::Compiler compiler;
    Row row{{"x", 2.0}, {"SUM_x", 100.0}};
    sphere::AggregateContext aggregates{{"SUM_x", 10.0}, {"AVG_x", 4.0}};

    auto shadowed = sphere::runtime::run_formula_with_aggregates(compiler, "SUM_x", row,
                                                                 aggregates);
    REQUIRE(shadowed.has_value());
    REQUIRE(std::get<double>(*shadowed) == 100.0);

    auto overlay = sphere::runtime::run_formula_with_aggregates(compiler, "x * AVG_x", row,
                                                                aggregates);
    REQUIRE(overlay.has_value());
    REQUIRE(std::get<double>(*overlay) == 8.0);
}

TEST_CASE("Unknown variable names the variable", "[evaluator]") {
    auto result = eval("price * qty", Row{{"price", 1.0}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::UnknownVariable);
    REQUIRE(result.error().message.find("qty") != std::string::npos);
    REQUIRE(result.error().formula == "price * qty");
}

TEST_CASE("Unknown function is rejected", "[evaluator]") {
    REQUIRE(error_kind("exp(1)") == ErrorKind::UnknownFunction);
    REQUIRE(error_kind("sum(1)") == ErrorKind::UnknownFunction);
    REQUIRE(error_kind("__import__('os')") == ErrorKind::UnknownFunction);
}

TEST_CASE("Chained comparisons require every pair to hold", "[evaluator]") {
    REQUIRE(boolean("1 < 2 < 3"));
    REQUIRE_FALSE(boolean("3 < 2 < 5"));
    REQUIRE_FALSE(boolean("1 < 3 < 2"));
    REQUIRE(boolean("2 == 2.0"));
    REQUIRE(boolean("1 <= 1 >= 0"));
    REQUIRE(boolean("'a' < 'b'"));
    REQUIRE_FALSE(boolean("'a' == 1"));
    REQUIRE(boolean("'a' != 1"));
}

TEST_CASE("Comparison chains short-circuit", "[evaluator]") {
    // missing would be an unknown variable if it were evaluated
    REQUIRE_FALSE(boolean("2 < 1 < missing"));
    REQUIRE(error_kind("1 < 2 < missing") == ErrorKind::UnknownVariable);
}

TEST_CASE("Comparing vectors is a type error", "[evaluator]") {
    Row row{{"v", Vector{1.0, 2.0}}};
    REQUIRE(error_kind("v < 1", row) == ErrorKind::Type);
    REQUIRE(error_kind("'a' < 1") == ErrorKind::Type);
}

TEST_CASE("Strings concatenate and nothing else", "[evaluator]") {
    auto joined = eval("'ab' + \"cd\"");
    REQUIRE(joined.has_value());
    REQUIRE(std::get<std::string>(*joined) == "abcd");
    REQUIRE(error_kind("'a' * 2") == ErrorKind::Type);
    REQUIRE(error_kind("'a' + 1") == ErrorKind::Type);
    REQUIRE(error_kind("-'a'") == ErrorKind::Type);
}

TEST_CASE("Null propagates through operators and calls", "[evaluator]") {
    Row row{{"missing", sphere::Null{}}, {"x", 4.0}};
    for (const char* text : {"None + 1", "missing * x", "-missing", "sqrt(-1) + 1",
                             "pow(missing, 2)", "x < missing", "abs(sqrt(-x))"}) {
        auto result = eval(text, row);
        INFO(text);
        REQUIRE(result.has_value());
        REQUIRE(sphere::is_null(*result));
    }
}

TEST_CASE("Vector arithmetic broadcasts scalars", "[evaluator]") {
    Row row{{"a", Vector{1.0, 2.0, 3.0}}, {"b", Vector{10.0, 20.0, 30.0}}, {"k", 2.0}};

    auto sum = eval("a + b", row);
    REQUIRE(sum.has_value());
    REQUIRE(std::get<Vector>(*sum) == Vector{11.0, 22.0, 33.0});

    auto scaled = eval("k * a - 1", row);
    REQUIRE(scaled.has_value());
    REQUIRE(std::get<Vector>(*scaled) == Vector{1.0, 3.0, 5.0});

    auto negated = eval("-a", row);
    REQUIRE(negated.has_value());
    REQUIRE(std::get<Vector>(*negated) == Vector{-1.0, -2.0, -3.0});

    REQUIRE(number("DOT(a * k, b)", row) == 280.0);
    REQUIRE(number("SUM(a ** 2)", row) == 14.0);
}

TEST_CASE("Vectors of different lengths cannot combine", "[evaluator]") {
    Row row{{"a", Vector{1.0, 2.0}}, {"b", Vector{1.0, 2.0, 3.0}}};
    REQUIRE(error_kind("a + b", row) == ErrorKind::Shape);
}

TEST_CASE("Evaluation never modifies the row", "[evaluator]") {
    Row row{{"x", 1.0}};
    REQUIRE(number("x + 1", row) == 2.0);
    REQUIRE(row.size() == 1);
    REQUIRE(std::get<double>(row.at("x")) == 1.0);
}

TEST_CASE("Evaluating a compiled formula directly", "[evaluator]") {
    sphere::Compiler compiler;
    auto formula = compiler.compile("max(a, b) - min(a, b)");
    REQUIRE(formula.has_value());
    Row row{{"a", 3.0}, {"b", 8.0}};
    auto result = sphere::runtime::evaluate(**formula, row);
    REQUIRE(result.has_value());
    REQUIRE(std::get<double>(*result) == 5.0);

    auto missing = sphere::runtime::evaluate(**formula, Row{{"a", 1.0}});
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().formula == "max(a, b) - min(a, b)");
}

TEST_CASE("Quadratic discriminant example", "[evaluator]") {
    sphere::Compiler compiler;
    Row row{{"A", 1.0}, {"B", -3.0}, {"C", 2.0}};
    auto disc = run_formula(compiler, "B**2 - 4*A*C", row);
    REQUIRE(disc.has_value());
    row.insert_or_assign("DISCRIMINANT", *disc);
    auto root = run_formula(compiler, "(-B + sqrt(DISCRIMINANT)) / (2*A)", row);
    REQUIRE(root.has_value());
    REQUIRE(std::get<double>(*root) == 2.0);

    row.insert_or_assign("C", 5.0);
    auto negative = run_formula(compiler, "B**2 - 4*A*C", row);
    row.insert_or_assign("DISCRIMINANT", *negative);
    auto no_root = run_formula(compiler, "(-B + sqrt(DISCRIMINANT)) / (2*A)", row);
    REQUIRE(no_root.has_value());
    REQUIRE(sphere::is_null(*no_root));
}
