#include <sphere/parser/ast.hpp>

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace sphere::parser {

auto binary_op_symbol(BinaryOp op) noexcept -> std::string_view {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Pow:
            return "**";
    }
    return "?";
}

auto compare_op_symbol(CompareOp op) noexcept -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "==";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
    }
    return "?";
}

namespace {

auto quote_string(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    out.push_back('"');
    return out;
}

}  // namespace

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return std::visit(
                    [](const auto& v) -> std::string {
                        using V = std::decay_t<decltype(v)>;
                        if constexpr (std::is_same_v<V, Null>) {
                            return "None";
                        } else if constexpr (std::is_same_v<V, bool>) {
                            return v ? "True" : "False";
                        } else if constexpr (std::is_same_v<V, double>) {
                            return format_number(v);
                        } else {
                            return quote_string(v);
                        }
                    },
                    node.value);
            } else if constexpr (std::is_same_v<T, IdentifierExpr>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return fmt::format("(-{})", to_string(*node.operand));
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left), binary_op_symbol(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                std::string out = "(" + to_string(*node.first);
                for (const auto& cmp : node.rest) {
                    out.append(fmt::format(" {} {}", compare_op_symbol(cmp.op),
                                           to_string(*cmp.operand)));
                }
                out.push_back(')');
                return out;
            } else {
                std::string out = node.callee + "(";
                for (std::size_t i = 0; i < node.args.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(to_string(*node.args[i]));
                }
                out.push_back(')');
                return out;
            }
        },
        expr.node);
}

}  // namespace sphere::parser
