#include <sphere/analysis/dependencies.hpp>
#include <sphere/runtime/functions.hpp>

#include <fmt/core.h>

#include <functional>
#include <string>
#include <type_traits>
#include <variant>

namespace sphere::analysis {

namespace {

// Pre-order walk over every node of the tree.
void walk(const parser::Expr& expr, const std::function<void(const parser::Expr&)>& visit) {
    visit(expr);
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                walk(*node.operand, visit);
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                walk(*node.left, visit);
                walk(*node.right, visit);
            } else if constexpr (std::is_same_v<T, parser::CompareExpr>) {
                walk(*node.first, visit);
                for (const auto& link : node.rest) {
                    walk(*link.operand, visit);
                }
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                for (const auto& arg : node.args) {
                    walk(*arg, visit);
                }
            }
        },
        expr.node);
}

}  // namespace

auto free_identifiers(const parser::Expr& expr) -> std::set<std::string> {
    std::set<std::string> names;
    walk(expr, [&](const parser::Expr& node) {
        if (const auto* ident = std::get_if<parser::IdentifierExpr>(&node.node)) {
            if (!runtime::is_function_name(ident->name)) {
                names.insert(ident->name);
            }
        }
    });
    return names;
}

auto free_identifiers(const CompiledFormula& formula) -> std::set<std::string> {
    return free_identifiers(formula.root());
}

auto aggregate_dependencies(const parser::Expr& expr) -> std::set<AggregateDependency> {
    std::set<AggregateDependency> deps;
    walk(expr, [&](const parser::Expr& node) {
        const auto* call = std::get_if<parser::CallExpr>(&node.node);
        if (call == nullptr || !runtime::is_aggregate_function(call->callee) ||
            call->args.size() != 1) {
            return;
        }
        if (const auto* column = std::get_if<parser::IdentifierExpr>(&call->args[0]->node)) {
            deps.insert(AggregateDependency{.function = call->callee, .column = column->name});
        }
    });
    return deps;
}

auto aggregate_dependencies(const CompiledFormula& formula) -> std::set<AggregateDependency> {
    return aggregate_dependencies(formula.root());
}

auto aggregate_key(const AggregateDependency& dependency) -> std::string {
    return fmt::format("{}_{}", dependency.function, dependency.column);
}

auto uses_scenario_function(const parser::Expr& expr) -> bool {
    bool found = false;
    walk(expr, [&](const parser::Expr& node) {
        if (const auto* call = std::get_if<parser::CallExpr>(&node.node)) {
            found = found || runtime::is_scenario_function(call->callee);
        }
    });
    return found;
}

auto uses_scenario_function(const CompiledFormula& formula) -> bool {
    return uses_scenario_function(formula.root());
}

}  // namespace sphere::analysis
