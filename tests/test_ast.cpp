// ast.hpp comes first so it is compiled without help from other headers.
#include <sphere/parser/ast.hpp>
#include <sphere/parser/parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>

using sphere::parser::BinaryOp;
using sphere::parser::CompareOp;

TEST_CASE("Operator symbols") {
    REQUIRE(sphere::parser::binary_op_symbol(BinaryOp::Pow) == std::string_view("**"));
    REQUIRE(sphere::parser::binary_op_symbol(BinaryOp::Div) == std::string_view("/"));
    REQUIRE(sphere::parser::compare_op_symbol(CompareOp::Ne) == std::string_view("!="));
    REQUIRE(sphere::parser::compare_op_symbol(CompareOp::Le) == std::string_view("<="));
}

TEST_CASE("Parsed trees record their height") {
    auto height = [](std::string_view source) {
        auto parsed = sphere::parser::parse(source);
        REQUIRE(parsed.has_value());
        return (*parsed)->height;
    };
    REQUIRE(height("x") == 1);
    REQUIRE(height("-x") == 2);
    REQUIRE(height("(((x)))") == 1);
    REQUIRE(height("1 + 2 * 3") == 3);
    REQUIRE(height("1 + 1 + 1 + 1") == 4);
    REQUIRE(height("max(1, pow(2, 3))") == 3);
    REQUIRE(height("1 < x < 2 + 3") == 3);
}
