#include <sphere/analysis/dependencies.hpp>
#include <sphere/runtime/evaluator.hpp>
#include <sphere/runtime/functions.hpp>
#include <sphere/runtime/vector_ops.hpp>

#include <fmt/core.h>

#include <cmath>
#include <vector>

namespace sphere::runtime {

auto Environment::find(const std::string& name) const -> const Value* {
    if (auto it = row_->find(name); it != row_->end()) {
        return &it->second;
    }
    if (aggregates_ != nullptr) {
        if (auto it = aggregates_->find(name); it != aggregates_->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

namespace {

using parser::BinaryExpr;
using parser::BinaryOp;
using parser::CallExpr;
using parser::CompareExpr;
using parser::CompareOp;
using parser::IdentifierExpr;
using parser::LiteralExpr;
using parser::UnaryExpr;

auto type_error(std::string message) -> EvalResult {
    return std::unexpected(make_error(ErrorKind::Type, std::move(message)));
}

template <typename T>
auto compare_ordered(CompareOp op, const T& lhs, const T& rhs) -> bool {
    switch (op) {
        case CompareOp::Eq:
            return lhs == rhs;
        case CompareOp::Ne:
            return lhs != rhs;
        case CompareOp::Lt:
            return lhs < rhs;
        case CompareOp::Le:
            return lhs <= rhs;
        case CompareOp::Gt:
            return lhs > rhs;
        case CompareOp::Ge:
            return lhs >= rhs;
    }
    return false;
}

// One link of a comparison chain. Null operands are handled by the caller.
auto compare_pair(CompareOp op, const Value& lhs, const Value& rhs)
    -> std::expected<bool, FormulaError> {
    if (std::holds_alternative<Vector>(lhs) || std::holds_alternative<Vector>(rhs)) {
        return std::unexpected(make_error(
            ErrorKind::Type, fmt::format("cannot compare {} with {} using {}", describe_shape(lhs),
                                         describe_shape(rhs), parser::compare_op_symbol(op))));
    }
    const auto* lstr = std::get_if<std::string>(&lhs);
    const auto* rstr = std::get_if<std::string>(&rhs);
    if (lstr != nullptr && rstr != nullptr) {
        return compare_ordered(op, *lstr, *rstr);
    }
    if (lstr != nullptr || rstr != nullptr) {
        // Mixed string/number: only (in)equality is meaningful.
        if (op == CompareOp::Eq) {
            return false;
        }
        if (op == CompareOp::Ne) {
            return true;
        }
        return std::unexpected(make_error(
            ErrorKind::Type,
            fmt::format("'{}' not supported between {} and {}", parser::compare_op_symbol(op),
                        kind_name(kind_of(lhs)), kind_name(kind_of(rhs)))));
    }
    return compare_ordered(op, *as_number(lhs), *as_number(rhs));
}

class Evaluator {
   public:
    explicit Evaluator(const Environment& env) : env_(env) {}

    auto eval(const parser::Expr& expr) -> EvalResult {
        return std::visit([this](const auto& node) { return eval_node(node); }, expr.node);
    }

   private:
    auto eval_node(const LiteralExpr& node) -> EvalResult {
        return std::visit([](const auto& v) -> Value { return v; }, node.value);
    }

    auto eval_node(const IdentifierExpr& node) -> EvalResult {
        if (const auto* value = env_.find(node.name)) {
            return *value;
        }
        return std::unexpected(make_error(ErrorKind::UnknownVariable,
                                          fmt::format("unknown variable '{}'", node.name)));
    }

    auto eval_node(const UnaryExpr& node) -> EvalResult {
        auto operand = eval(*node.operand);
        if (!operand) {
            return operand;
        }
        switch (node.op) {
            case parser::UnaryOp::Negate:
                if (is_null(*operand)) {
                    return Value{Null{}};
                }
                if (const auto* vec = std::get_if<Vector>(&*operand)) {
                    return Value{vec->map([](double x) { return -x; })};
                }
                if (auto number = as_number(*operand)) {
                    return Value{-*number};
                }
                return type_error(fmt::format("bad operand for unary -: {}",
                                              kind_name(kind_of(*operand))));
        }
        return std::unexpected(make_error(ErrorKind::UnsupportedExpression, "unknown unary op"));
    }

    auto eval_node(const BinaryExpr& node) -> EvalResult {
        auto lhs = eval(*node.left);
        if (!lhs) {
            return lhs;
        }
        auto rhs = eval(*node.right);
        if (!rhs) {
            return rhs;
        }
        if (is_null(*lhs) || is_null(*rhs)) {
            return Value{Null{}};
        }
        const auto symbol = parser::binary_op_symbol(node.op);
        const auto* lstr = std::get_if<std::string>(&*lhs);
        const auto* rstr = std::get_if<std::string>(&*rhs);
        if (lstr != nullptr || rstr != nullptr) {
            if (node.op == BinaryOp::Add && lstr != nullptr && rstr != nullptr) {
                return Value{*lstr + *rstr};
            }
            return type_error(fmt::format("unsupported operand kinds for {}: {} and {}", symbol,
                                          kind_name(kind_of(*lhs)), kind_name(kind_of(*rhs))));
        }
        switch (node.op) {
            case BinaryOp::Add:
                return broadcast(*lhs, *rhs, [](double a, double b) { return a + b; }, symbol);
            case BinaryOp::Sub:
                return broadcast(*lhs, *rhs, [](double a, double b) { return a - b; }, symbol);
            case BinaryOp::Mul:
                return broadcast(*lhs, *rhs, [](double a, double b) { return a * b; }, symbol);
            case BinaryOp::Div:
                return broadcast(*lhs, *rhs, [](double a, double b) { return a / b; }, symbol);
            case BinaryOp::Pow:
                return broadcast(*lhs, *rhs, [](double a, double b) { return std::pow(a, b); },
                                 symbol);
        }
        return std::unexpected(make_error(ErrorKind::UnsupportedExpression, "unknown binary op"));
    }

    auto eval_node(const CompareExpr& node) -> EvalResult {
        auto lhs = eval(*node.first);
        if (!lhs) {
            return lhs;
        }
        Value left = std::move(*lhs);
        for (const auto& link : node.rest) {
            auto rhs = eval(*link.operand);
            if (!rhs) {
                return rhs;
            }
            if (is_null(left) || is_null(*rhs)) {
                return Value{Null{}};
            }
            auto holds = compare_pair(link.op, left, *rhs);
            if (!holds) {
                return std::unexpected(holds.error());
            }
            if (!*holds) {
                return Value{false};
            }
            left = std::move(*rhs);
        }
        return Value{true};
    }

    auto eval_node(const CallExpr& node) -> EvalResult {
        auto fn = lookup_function(node.callee);
        if (!fn.has_value()) {
            return std::unexpected(make_error(
                ErrorKind::UnknownFunction,
                fmt::format("function '{}' is not allowed", node.callee)));
        }
        // SUM(col) and friends use a precomputed FUNC_col value when one is in scope.
        if (is_aggregate_function(node.callee) && node.args.size() == 1) {
            if (const auto* column = std::get_if<IdentifierExpr>(&node.args.front()->node)) {
                auto key = analysis::aggregate_key(
                    {.function = node.callee, .column = column->name});
                if (const auto* value = env_.find(key)) {
                    return *value;
                }
            }
        }
        std::vector<Value> args;
        args.reserve(node.args.size());
        for (const auto& arg : node.args) {
            auto value = eval(*arg);
            if (!value) {
                return value;
            }
            args.push_back(std::move(*value));
        }
        return call_function(*fn, args);
    }

    const Environment& env_;
};

}  // namespace

auto evaluate(const parser::Expr& expr, const Environment& env) -> EvalResult {
    Evaluator evaluator(env);
    return evaluator.eval(expr);
}

auto evaluate(const CompiledFormula& formula, const Row& row, const AggregateContext* aggregates)
    -> EvalResult {
    auto result = evaluate(formula.root(), Environment(row, aggregates));
    if (!result) {
        auto error = std::move(result.error());
        error.formula = formula.text();
        return std::unexpected(std::move(error));
    }
    return result;
}

auto run_formula(const Compiler& compiler, std::string_view text, const Row& row) -> EvalResult {
    auto formula = compiler.compile(text);
    if (!formula) {
        return std::unexpected(formula.error());
    }
    return evaluate(**formula, row);
}

auto run_formula_with_aggregates(const Compiler& compiler, std::string_view text, const Row& row,
                                 const AggregateContext& aggregates) -> EvalResult {
    auto formula = compiler.compile(text);
    if (!formula) {
        return std::unexpected(formula.error());
    }
    return evaluate(**formula, row, &aggregates);
}

}  // namespace sphere::runtime
