#pragma once

#include <sphere/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sphere::parser {

/// Constant: number, string, boolean or None.
struct LiteralExpr {
    std::variant<Null, double, bool, std::string> value;
};

/// Variable reference resolved against the row / aggregate environment.
struct IdentifierExpr {
    std::string name;
};

enum class UnaryOp : std::uint8_t {
    Negate,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Pow,
};

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct UnaryExpr {
    UnaryOp op = UnaryOp::Negate;
    ExprPtr operand;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct Comparison {
    CompareOp op = CompareOp::Eq;
    ExprPtr operand;
};

/// `first op0 operand0 op1 operand1 ...`; true iff every adjacent pair holds.
struct CompareExpr {
    ExprPtr first;
    std::vector<Comparison> rest;
};

/// Call of a bare function name. Computed call targets are rejected by the
/// parser and cannot be represented.
struct CallExpr {
    std::string callee;
    std::vector<ExprPtr> args;
};

struct Expr {
    std::variant<LiteralExpr, IdentifierExpr, UnaryExpr, BinaryExpr, CompareExpr, CallExpr> node;
    /// Longest path from this node to a leaf, counting both ends.
    std::size_t height = 1;
};

/// Deepest tree the parser builds. Evaluation and analysis recurse once per
/// level, so this bounds their stack use.
inline constexpr std::size_t kMaxTreeHeight = 1000;

/// Deepest nesting of parentheses, call arguments and unary operators.
inline constexpr std::size_t kMaxNesting = 200;

[[nodiscard]] auto binary_op_symbol(BinaryOp op) noexcept -> std::string_view;
[[nodiscard]] auto compare_op_symbol(CompareOp op) noexcept -> std::string_view;

/// Render a tree back to formula text (fully parenthesised binary nodes).
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

}  // namespace sphere::parser
