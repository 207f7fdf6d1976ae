#include <sphere/core/column.hpp>
#include <sphere/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

TEST_CASE("Vector basic operations", "[core][column]") {
    sphere::Vector col{1.0, 2.0, 3.0, 4.0, 5.0};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1.0);
        REQUIRE(col[4] == 5.0);
    }

    SECTION("push_back grows the column") {
        col.push_back(6.0);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6.0);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.values();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3.0);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Vector map and missing elements", "[core][column]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    sphere::Vector col{1.0, nan, 3.0, 4.0};

    REQUIRE(col.present_count() == 3);
    REQUIRE(col.present_sum() == 8.0);
    REQUIRE(sphere::Vector{}.present_sum() == 0.0);

    auto doubled = col.map([](double x) { return x * 2.0; });
    REQUIRE(doubled.size() == 4);
    REQUIRE(doubled[0] == 2.0);
    REQUIRE(std::isnan(doubled[1]));
    REQUIRE(doubled[3] == 8.0);
}

TEST_CASE("Value kinds and shapes", "[core][value]") {
    REQUIRE(sphere::kind_of(sphere::Value{sphere::Null{}}) == sphere::ValueKind::Null);
    REQUIRE(sphere::kind_of(sphere::Value{1.5}) == sphere::ValueKind::Number);
    REQUIRE(sphere::kind_of(sphere::Value{true}) == sphere::ValueKind::Bool);
    REQUIRE(sphere::kind_of(sphere::Value{std::string("a")}) == sphere::ValueKind::String);
    REQUIRE(sphere::kind_of(sphere::Value{sphere::Vector{1.0}}) == sphere::ValueKind::Vector);

    REQUIRE(sphere::describe_shape(sphere::Value{sphere::Vector{1.0, 2.0, 3.0}}) ==
            "vector of length 3");
    REQUIRE(sphere::describe_shape(sphere::Value{2.0}) == "scalar number");

    REQUIRE(sphere::as_number(sphere::Value{true}) == 1.0);
    REQUIRE(sphere::as_number(sphere::Value{false}) == 0.0);
    REQUIRE_FALSE(sphere::as_number(sphere::Value{std::string("x")}).has_value());
}

TEST_CASE("Value formatting", "[core][value]") {
    REQUIRE(sphere::format_value(sphere::Value{sphere::Null{}}) == "null");
    REQUIRE(sphere::format_value(sphere::Value{2.0}) == "2");
    REQUIRE(sphere::format_value(sphere::Value{0.5}) == "0.5");
    REQUIRE(sphere::format_value(sphere::Value{true}) == "true");
    REQUIRE(sphere::format_value(sphere::Value{sphere::Vector{1.0, 2.5}}) == "[1, 2.5]");
    REQUIRE(sphere::format_number(std::numeric_limits<double>::quiet_NaN()) == "nan");
    REQUIRE(sphere::format_number(-std::numeric_limits<double>::infinity()) == "-inf");
}
