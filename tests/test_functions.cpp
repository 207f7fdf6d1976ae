#include <sphere/runtime/functions.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using sphere::ErrorKind;
using sphere::Null;
using sphere::Value;
using sphere::Vector;
using sphere::runtime::call_function;
using sphere::runtime::Function;

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

auto call(Function fn, std::vector<Value> args) -> std::expected<Value, sphere::FormulaError> {
    return call_function(fn, args);
}

auto number(Function fn, std::vector<Value> args) -> double {
    auto result = call(fn, std::move(args));
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<double>(*result));
    return std::get<double>(*result);
}

auto failure(Function fn, std::vector<Value> args) -> sphere::FormulaError {
    auto result = call(fn, std::move(args));
    REQUIRE_FALSE(result.has_value());
    return result.error();
}

}  // namespace

TEST_CASE("Function names resolve exactly", "[functions]") {
    REQUIRE(sphere::runtime::lookup_function("pow") == Function::Pow);
    REQUIRE(sphere::runtime::lookup_function("SUM") == Function::Sum);
    REQUIRE(sphere::runtime::lookup_function("MIN") == Function::ColumnMin);
    REQUIRE(sphere::runtime::lookup_function("min") == Function::Min);
    REQUIRE_FALSE(sphere::runtime::lookup_function("sum").has_value());
    REQUIRE_FALSE(sphere::runtime::lookup_function("eval").has_value());
    REQUIRE(sphere::runtime::function_name(Function::Norm) == "NORM");
    REQUIRE(sphere::runtime::all_functions().size() == 12);
}

TEST_CASE("Scenario and aggregate function predicates", "[functions]") {
    REQUIRE(sphere::runtime::is_scenario_function("DOT"));
    REQUIRE(sphere::runtime::is_scenario_function("norm"));
    REQUIRE(sphere::runtime::is_scenario_function("Dot"));
    REQUIRE_FALSE(sphere::runtime::is_scenario_function("SUM"));

    REQUIRE(sphere::runtime::is_aggregate_function("COUNT"));
    REQUIRE(sphere::runtime::is_aggregate_function("MAX"));
    REQUIRE_FALSE(sphere::runtime::is_aggregate_function("avg"));
    REQUIRE_FALSE(sphere::runtime::is_aggregate_function("DOT"));
}

TEST_CASE("pow squares one argument and raises with two", "[functions]") {
    REQUIRE(number(Function::Pow, {3.0}) == 9.0);
    REQUIRE(number(Function::Pow, {2.0, 10.0}) == 1024.0);

    auto error = failure(Function::Pow, {1.0, 2.0, 3.0});
    REQUIRE(error.kind == ErrorKind::Arity);
    REQUIRE(error.message.find("pow") != std::string::npos);
    REQUIRE(failure(Function::Pow, {}).kind == ErrorKind::Arity);

    auto squares = call(Function::Pow, {Vector{1.0, 2.0, 3.0}});
    REQUIRE(squares.has_value());
    REQUIRE(std::get<Vector>(*squares) == Vector{1.0, 4.0, 9.0});
}

TEST_CASE("sqrt of a negative number is null", "[functions]") {
    REQUIRE(number(Function::Sqrt, {4.0}) == 2.0);

    auto negative = call(Function::Sqrt, {-1.0});
    REQUIRE(negative.has_value());
    REQUIRE(sphere::is_null(*negative));

    REQUIRE(failure(Function::Sqrt, {Vector{4.0}}).kind == ErrorKind::Shape);
    REQUIRE(failure(Function::Sqrt, {std::string("x")}).kind == ErrorKind::Type);
    REQUIRE(failure(Function::Sqrt, {1.0, 2.0}).kind == ErrorKind::Arity);
}

TEST_CASE("abs works on scalars and vectors", "[functions]") {
    REQUIRE(number(Function::Abs, {-2.5}) == 2.5);
    auto vec = call(Function::Abs, {Vector{-1.0, 2.0, -3.0}});
    REQUIRE(vec.has_value());
    REQUIRE(std::get<Vector>(*vec) == Vector{1.0, 2.0, 3.0});
}

TEST_CASE("min and max take a vector or several scalars", "[functions]") {
    REQUIRE(number(Function::Min, {3.0, 1.0, 2.0}) == 1.0);
    REQUIRE(number(Function::Max, {3.0, 1.0, 2.0}) == 3.0);
    REQUIRE(number(Function::Max, {Vector{4.0, 9.0, 1.0}}) == 9.0);
    REQUIRE(number(Function::Min, {true, 5.0}) == 1.0);

    REQUIRE(failure(Function::Min, {Vector{}}).kind == ErrorKind::Shape);
    REQUIRE(failure(Function::Max, {7.0}).kind == ErrorKind::Shape);
    REQUIRE(failure(Function::Min, {}).kind == ErrorKind::Arity);
}

TEST_CASE("Column aggregates skip NaN", "[functions]") {
    Vector values{1.0, kNaN, 3.0};

    REQUIRE(number(Function::Sum, {values}) == 4.0);
    REQUIRE(number(Function::Avg, {values}) == 2.0);
    REQUIRE(number(Function::Count, {values}) == 3.0);
    REQUIRE(number(Function::ColumnMin, {values}) == 1.0);
    REQUIRE(number(Function::ColumnMax, {values}) == 3.0);
}

TEST_CASE("Column aggregates on empty input", "[functions]") {
    REQUIRE(number(Function::Sum, {Vector{}}) == 0.0);
    REQUIRE(number(Function::Avg, {Vector{}}) == 0.0);
    REQUIRE(number(Function::Avg, {Vector{kNaN}}) == 0.0);
    REQUIRE(number(Function::Count, {Vector{}}) == 0.0);
    REQUIRE(std::isnan(number(Function::ColumnMax, {Vector{kNaN}})));
}

TEST_CASE("Column aggregates require a vector", "[functions]") {
    REQUIRE(failure(Function::Sum, {5.0}).kind == ErrorKind::Shape);
    REQUIRE(failure(Function::Avg, {Vector{1.0}, Vector{2.0}}).kind == ErrorKind::Arity);
}

TEST_CASE("DOT sums elementwise products", "[functions]") {
    REQUIRE(number(Function::Dot, {Vector{100.0, 200.0, 300.0}, Vector{2.0, 3.0, 4.0}}) ==
            2000.0);
    REQUIRE(number(Function::Dot, {Vector{1.0, kNaN, 3.0}, Vector{1.0, 1.0, 1.0}}) == 4.0);
    REQUIRE(number(Function::Dot, {Vector{}, Vector{}}) == 0.0);
}

TEST_CASE("DOT rejects mismatched or scalar arguments", "[functions]") {
    auto mismatch = failure(Function::Dot, {Vector{1.0, 2.0}, Vector{1.0, 2.0, 3.0}});
    REQUIRE(mismatch.kind == ErrorKind::Shape);

    auto scalar_first = failure(Function::Dot, {5.0, Vector{1.0}});
    REQUIRE(scalar_first.kind == ErrorKind::Shape);
    REQUIRE(scalar_first.message.find("first") != std::string::npos);
    REQUIRE(scalar_first.message.find("scalar number") != std::string::npos);

    auto scalar_second = failure(Function::Dot, {Vector{1.0}, 5.0});
    REQUIRE(scalar_second.kind == ErrorKind::Shape);
    REQUIRE(scalar_second.message.find("second") != std::string::npos);

    REQUIRE(failure(Function::Dot, {Vector{1.0}}).kind == ErrorKind::Arity);
}

TEST_CASE("NORM is the Euclidean length", "[functions]") {
    REQUIRE(number(Function::Norm, {Vector{3.0, 4.0}}) == 5.0);
    REQUIRE(number(Function::Norm, {Vector{3.0, kNaN, 4.0}}) == 5.0);
    REQUIRE(number(Function::Norm, {Vector{1.0, 1.0}}) == Catch::Approx(std::sqrt(2.0)));
    REQUIRE(failure(Function::Norm, {2.0}).kind == ErrorKind::Shape);
}

TEST_CASE("A null argument makes any call null", "[functions]") {
    for (auto fn : {Function::Pow, Function::Sqrt, Function::Abs, Function::Sum}) {
        auto result = call(fn, {Null{}});
        REQUIRE(result.has_value());
        REQUIRE(sphere::is_null(*result));
    }
    auto result = call(Function::Dot, {Vector{1.0}, Null{}});
    REQUIRE(result.has_value());
    REQUIRE(sphere::is_null(*result));
}

TEST_CASE("Arity is checked before null propagation", "[functions]") {
    auto error = failure(Function::Pow, {1.0, 2.0, Null{}});
    REQUIRE(error.kind == ErrorKind::Arity);
    REQUIRE(error.message == "pow() takes 1 or 2 arguments, got 3");

    REQUIRE(failure(Function::Dot, {Null{}}).kind == ErrorKind::Arity);
    REQUIRE(failure(Function::Sqrt, {Null{}, 4.0}).kind == ErrorKind::Arity);
    REQUIRE(failure(Function::Max, {}).kind == ErrorKind::Arity);
    REQUIRE(sphere::is_null(*call(Function::Max, {Null{}, 2.0})));
}
