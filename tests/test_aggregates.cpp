#include <sphere/compiler/compiler.hpp>
#include <sphere/runtime/aggregates.hpp>
#include <sphere/runtime/evaluator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <vector>

using sphere::Row;
using sphere::analysis::AggregateDependency;

namespace {

auto sales_rows() -> std::vector<Row> {
    return {
        Row{{"sales", 10.0}, {"region", std::string("north")}},
        Row{{"sales", 30.0}, {"region", std::string("south")}},
        Row{{"sales", sphere::Null{}}, {"region", std::string("east")}},
        Row{{"region", std::string("west")}},
    };
}

}  // namespace

TEST_CASE("Gathering a column fills gaps with NaN", "[aggregates]") {
    auto rows = sales_rows();
    auto column = sphere::runtime::gather_column(rows, "sales");
    REQUIRE(column.size() == 4);
    REQUIRE(column[0] == 10.0);
    REQUIRE(column[1] == 30.0);
    REQUIRE(std::isnan(column[2]));
    REQUIRE(std::isnan(column[3]));

    auto strings = sphere::runtime::gather_column(rows, "region");
    REQUIRE(std::isnan(strings[0]));
}

TEST_CASE("Aggregates are computed once per column", "[aggregates]") {
    auto rows = sales_rows();
    std::set<AggregateDependency> deps{
        {"SUM", "sales"}, {"AVG", "sales"}, {"COUNT", "sales"}, {"MIN", "sales"}, {"MAX", "sales"},
    };

    auto context = sphere::runtime::precompute_aggregates(rows, deps);
    REQUIRE(context.has_value());
    REQUIRE(context->size() == 5);
    REQUIRE(std::get<double>(context->at("SUM_sales")) == 40.0);
    REQUIRE(std::get<double>(context->at("AVG_sales")) == 20.0);
    REQUIRE(std::get<double>(context->at("COUNT_sales")) == 4.0);
    REQUIRE(std::get<double>(context->at("MIN_sales")) == 10.0);
    REQUIRE(std::get<double>(context->at("MAX_sales")) == 30.0);
}

TEST_CASE("Aggregating a column no row has fails", "[aggregates]") {
    auto rows = sales_rows();
    auto context = sphere::runtime::precompute_aggregates(rows, {{"SUM", "profit"}});
    REQUIRE_FALSE(context.has_value());
    REQUIRE(context.error().kind == sphere::ErrorKind::UnknownVariable);
    REQUIRE(context.error().message.find("profit") != std::string::npos);
}

TEST_CASE("Dependencies are collected across formulas", "[aggregates]") {
    sphere::Compiler compiler;
    std::vector<sphere::FormulaPtr> formulas{
        *compiler.compile("sales / SUM(sales)"),
        *compiler.compile("AVG(sales) + SUM(sales)"),
        *compiler.compile("sales * 2"),
    };
    auto deps = sphere::runtime::collect_aggregate_dependencies(formulas);
    REQUIRE(deps == std::set<AggregateDependency>{{"AVG", "sales"}, {"SUM", "sales"}});
}

TEST_CASE("Precomputed aggregates answer FUNC_column lookups", "[aggregates]") {
    sphere::Compiler compiler;
    auto rows = sales_rows();
    auto context = sphere::runtime::precompute_aggregates(rows, {{"SUM", "sales"}});
    REQUIRE(context.has_value());

    auto share = sphere::runtime::run_formula_with_aggregates(compiler, "sales / SUM_sales",
                                                              rows[1], *context);
    REQUIRE(share.has_value());
    REQUIRE(std::get<double>(*share) == 0.75);
}

TEST_CASE("Aggregate calls resolve to precomputed values", "[aggregates]") {
    sphere::Compiler compiler;
    auto rows = sales_rows();
    auto formula = compiler.compile("sales / SUM(sales)");
    REQUIRE(formula.has_value());

    // Without a context SUM() sees a scalar.
    auto plain = sphere::runtime::evaluate(**formula, rows[0]);
    REQUIRE_FALSE(plain.has_value());
    REQUIRE(plain.error().kind == sphere::ErrorKind::Shape);

    auto deps = sphere::runtime::collect_aggregate_dependencies(std::vector{*formula});
    auto context = sphere::runtime::precompute_aggregates(rows, deps);
    REQUIRE(context.has_value());
    auto share = sphere::runtime::evaluate(**formula, rows[0], &*context);
    REQUIRE(share.has_value());
    REQUIRE(std::get<double>(*share) == 0.25);
}
