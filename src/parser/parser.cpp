#include <sphere/parser/lexer.hpp>
#include <sphere/parser/parser.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <utility>

namespace sphere::parser {

namespace {

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_formula() -> ParseResult {
        if (is_at_end()) {
            return std::unexpected(make_error(peek(), ErrorKind::Syntax, "empty formula"));
        }
        auto expr = parse_expression();
        if (!expr) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            reject_trailing(peek());
            return std::unexpected(error_);
        }
        return expr;
    }

   private:
    /// Decrements the nesting depth when a recursive rule returns.
    class NestingScope {
       public:
        explicit NestingScope(std::size_t& depth) : depth_(depth) { ++depth_; }
        ~NestingScope() { --depth_; }
        NestingScope(const NestingScope&) = delete;
        auto operator=(const NestingScope&) -> NestingScope& = delete;

       private:
        std::size_t& depth_;
    };

    auto too_deep() -> ExprPtr {
        return fail_expr(peek(), ErrorKind::Syntax, "formula nested too deeply");
    }

    auto parse_expression() -> ExprPtr {
        if (check(TokenKind::KeywordLambda)) {
            return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                             "lambda expressions are not supported");
        }
        return parse_comparison();
    }

    auto parse_comparison() -> ExprPtr {
        auto first = parse_term();
        if (!first) {
            return nullptr;
        }
        std::vector<Comparison> rest;
        while (true) {
            auto op = match_compare_op();
            if (!op.has_value()) {
                break;
            }
            auto operand = parse_term();
            if (!operand) {
                return nullptr;
            }
            rest.push_back(Comparison{.op = *op, .operand = std::move(operand)});
        }
        if (check(TokenKind::KeywordIn) || check(TokenKind::KeywordIs) ||
            (check(TokenKind::KeywordNot) && check_next(TokenKind::KeywordIn))) {
            return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                             fmt::format("comparison operator {} is not supported",
                                         format_token(peek())));
        }
        if (rest.empty()) {
            return first;
        }
        auto node = std::make_unique<Expr>();
        std::size_t height = first->height;
        for (const auto& item : rest) {
            height = std::max(height, item.operand->height);
        }
        node->height = height + 1;
        node->node = CompareExpr{.first = std::move(first), .rest = std::move(rest)};
        return checked(std::move(node));
    }

    auto match_compare_op() -> std::optional<CompareOp> {
        if (match(TokenKind::EqEq)) {
            return CompareOp::Eq;
        }
        if (match(TokenKind::BangEq)) {
            return CompareOp::Ne;
        }
        if (match(TokenKind::Lt)) {
            return CompareOp::Lt;
        }
        if (match(TokenKind::Le)) {
            return CompareOp::Le;
        }
        if (match(TokenKind::Gt)) {
            return CompareOp::Gt;
        }
        if (match(TokenKind::Ge)) {
            return CompareOp::Ge;
        }
        return std::nullopt;
    }

    auto parse_term() -> ExprPtr {
        auto expr = parse_factor();
        if (!expr) {
            return nullptr;
        }
        while (true) {
            if (match(TokenKind::Plus)) {
                auto right = parse_factor();
                if (!right) {
                    return nullptr;
                }
                expr = make_binary(BinaryOp::Add, std::move(expr), std::move(right));
                if (!expr) {
                    return nullptr;
                }
                continue;
            }
            if (match(TokenKind::Minus)) {
                auto right = parse_factor();
                if (!right) {
                    return nullptr;
                }
                expr = make_binary(BinaryOp::Sub, std::move(expr), std::move(right));
                if (!expr) {
                    return nullptr;
                }
                continue;
            }
            break;
        }
        return expr;
    }

    auto parse_factor() -> ExprPtr {
        auto expr = parse_unary();
        if (!expr) {
            return nullptr;
        }
        while (true) {
            if (match(TokenKind::Star)) {
                auto right = parse_unary();
                if (!right) {
                    return nullptr;
                }
                expr = make_binary(BinaryOp::Mul, std::move(expr), std::move(right));
                if (!expr) {
                    return nullptr;
                }
                continue;
            }
            if (match(TokenKind::Slash)) {
                auto right = parse_unary();
                if (!right) {
                    return nullptr;
                }
                expr = make_binary(BinaryOp::Div, std::move(expr), std::move(right));
                if (!expr) {
                    return nullptr;
                }
                continue;
            }
            if (check(TokenKind::Percent) || check(TokenKind::SlashSlash) ||
                check(TokenKind::At)) {
                return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                                 fmt::format("operator {} is not supported", format_token(peek())));
            }
            break;
        }
        return expr;
    }

    // Every recursive rule (parentheses, call arguments, unary operators and
    // `**` exponents) passes through here, so the nesting limit is kept here.
    auto parse_unary() -> ExprPtr {
        if (depth_ >= kMaxNesting) {
            return too_deep();
        }
        NestingScope scope(depth_);
        if (match(TokenKind::Minus)) {
            auto operand = parse_unary();
            if (!operand) {
                return nullptr;
            }
            return make_unary(UnaryOp::Negate, std::move(operand));
        }
        if (match(TokenKind::Plus)) {
            return parse_unary();
        }
        if (check(TokenKind::KeywordNot) || check(TokenKind::Tilde)) {
            return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                             fmt::format("unary operator {} is not supported",
                                         format_token(peek())));
        }
        return parse_power();
    }

    // `**` binds tighter than a unary minus on its left and is right-associative:
    // -2 ** 2 == -4, 2 ** 3 ** 2 == 512, 2 ** -1 == 0.5.
    auto parse_power() -> ExprPtr {
        auto base = parse_postfix();
        if (!base) {
            return nullptr;
        }
        if (match(TokenKind::StarStar)) {
            auto exponent = parse_unary();
            if (!exponent) {
                return nullptr;
            }
            return make_binary(BinaryOp::Pow, std::move(base), std::move(exponent));
        }
        return base;
    }

    auto parse_postfix() -> ExprPtr {
        auto expr = parse_primary();
        if (!expr) {
            return nullptr;
        }
        if (check(TokenKind::LParen)) {
            return fail_expr(peek(), ErrorKind::InvalidCallTarget,
                             "only calls of a bare function name are allowed");
        }
        if (check(TokenKind::Dot)) {
            if (check_next(TokenKind::Identifier)) {
                // a.b(...) is a computed call target; a.b alone is attribute access.
                if (check_at(2, TokenKind::LParen)) {
                    return fail_expr(peek(), ErrorKind::InvalidCallTarget,
                                     "only calls of a bare function name are allowed");
                }
                return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                                 "attribute access is not supported");
            }
            return fail_expr(peek(), ErrorKind::Syntax, "expected attribute name after '.'");
        }
        if (check(TokenKind::LBracket)) {
            return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                             "subscripts are not supported");
        }
        return expr;
    }

    auto parse_primary() -> ExprPtr {
        if (match(TokenKind::Identifier)) {
            std::string name(previous().lexeme);
            if (match(TokenKind::LParen)) {
                return parse_call(std::move(name));
            }
            auto expr = std::make_unique<Expr>();
            expr->node = IdentifierExpr{.name = std::move(name)};
            return expr;
        }
        if (match(TokenKind::NumberLiteral)) {
            auto value = parse_number(previous().lexeme);
            if (!value.has_value()) {
                return fail_expr(previous(), ErrorKind::Syntax, "invalid number literal");
            }
            return make_literal(*value);
        }
        if (match(TokenKind::BoolLiteral)) {
            const auto text = previous().lexeme;
            return make_literal(text == "True" || text == "true");
        }
        if (match(TokenKind::NoneLiteral)) {
            return make_literal(Null{});
        }
        if (match(TokenKind::StringLiteral)) {
            return make_literal(unescape_string(previous().lexeme));
        }
        if (match(TokenKind::LParen)) {
            auto expr = parse_expression();
            if (!expr) {
                return nullptr;
            }
            if (check(TokenKind::Comma)) {
                return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                                 "tuples are not supported");
            }
            if (!consume(TokenKind::RParen, "expected ')' after expression")) {
                return nullptr;
            }
            return expr;
        }
        if (check(TokenKind::LBracket) || check(TokenKind::LBrace)) {
            return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                             "list, set and dict displays are not supported");
        }
        if (check(TokenKind::KeywordLambda)) {
            return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                             "lambda expressions are not supported");
        }
        if (check(TokenKind::Error)) {
            return fail_expr(peek(), ErrorKind::Syntax,
                             fmt::format("invalid token {}", format_token(peek())));
        }
        return fail_expr(peek(), ErrorKind::Syntax,
                         fmt::format("expected expression, found {}", format_token(peek())));
    }

    auto parse_call(std::string callee) -> ExprPtr {
        std::vector<ExprPtr> args;
        if (!check(TokenKind::RParen)) {
            do {
                if (check(TokenKind::RParen)) {
                    break;  // trailing comma
                }
                if (check(TokenKind::Identifier) && check_next(TokenKind::Eq)) {
                    return fail_expr(peek(), ErrorKind::Syntax,
                                     fmt::format("keyword arguments are not allowed in call to {}",
                                                 callee));
                }
                if (check(TokenKind::Star) || check(TokenKind::StarStar)) {
                    return fail_expr(peek(), ErrorKind::UnsupportedExpression,
                                     "argument unpacking is not supported");
                }
                auto arg = parse_expression();
                if (!arg) {
                    return nullptr;
                }
                args.push_back(std::move(arg));
            } while (match(TokenKind::Comma));
        }
        if (!consume(TokenKind::RParen, "expected ')' after argument list")) {
            return nullptr;
        }
        auto expr = std::make_unique<Expr>();
        for (const auto& arg : args) {
            expr->height = std::max(expr->height, arg->height + 1);
        }
        expr->node = CallExpr{.callee = std::move(callee), .args = std::move(args)};
        return checked(std::move(expr));
    }

    void reject_trailing(const Token& token) {
        switch (token.kind) {
            case TokenKind::KeywordAnd:
            case TokenKind::KeywordOr:
                error_ = make_error(token, ErrorKind::UnsupportedExpression,
                                    fmt::format("boolean operator {} is not supported",
                                                format_token(token)));
                return;
            case TokenKind::KeywordIf:
                error_ = make_error(token, ErrorKind::UnsupportedExpression,
                                    "conditional expressions are not supported");
                return;
            case TokenKind::Caret:
            case TokenKind::Amp:
            case TokenKind::Pipe:
                error_ = make_error(
                    token, ErrorKind::UnsupportedExpression,
                    fmt::format("bitwise operator {} is not supported", format_token(token)));
                return;
            case TokenKind::Eq:
                error_ = make_error(token, ErrorKind::Syntax,
                                    "assignment is not allowed in a formula");
                return;
            default:
                error_ = make_error(token, ErrorKind::Syntax,
                                    fmt::format("unexpected token {} after expression",
                                                format_token(token)));
                return;
        }
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), ErrorKind::Syntax,
                            fmt::format("{}, found {}", message, format_token(peek())));
        return false;
    }

    auto check(TokenKind kind) const -> bool {
        if (is_at_end()) {
            return kind == TokenKind::Eof;
        }
        return peek().kind == kind;
    }

    auto check_next(TokenKind kind) const -> bool { return check_at(1, kind); }

    auto check_at(std::size_t offset, TokenKind kind) const -> bool {
        if (current_ + offset >= tokens_.size()) {
            return kind == TokenKind::Eof;
        }
        return tokens_[current_ + offset].kind == kind;
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(const Token& token, ErrorKind kind, std::string_view message)
        -> ParseError {
        return ParseError{
            .kind = kind,
            .message = std::string(message),
            .line = token.line,
            .column = token.column,
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof || token.lexeme.empty()) {
            return "'<eof>'";
        }
        return fmt::format("'{}'", std::string(token.lexeme));
    }

    auto fail_expr(const Token& token, ErrorKind kind, std::string_view message) -> ExprPtr {
        error_ = make_error(token, kind, message);
        return nullptr;
    }

    static auto parse_number(std::string_view text) -> std::optional<double> {
        std::string tmp;
        tmp.reserve(text.size());
        for (char ch : text) {
            if (ch != '_') {
                tmp.push_back(ch);
            }
        }
        double value = 0.0;
        const char* last = tmp.data() + tmp.size();
        auto [ptr, ec] = std::from_chars(tmp.data(), last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    static auto unescape_string(std::string_view text) -> std::string {
        if (text.size() < 2) {
            return std::string(text);
        }
        std::string result;
        result.reserve(text.size() - 2);
        for (std::size_t idx = 1; idx + 1 < text.size(); ++idx) {
            char ch = text[idx];
            if (ch == '\\' && idx + 1 < text.size() - 1) {
                char next = text[idx + 1];
                switch (next) {
                    case 'n':
                        result.push_back('\n');
                        break;
                    case 'r':
                        result.push_back('\r');
                        break;
                    case 't':
                        result.push_back('\t');
                        break;
                    case '0':
                        result.push_back('\0');
                        break;
                    default:
                        result.push_back(next);
                        break;
                }
                idx += 1;
                continue;
            }
            result.push_back(ch);
        }
        return result;
    }

    template <typename T>
    static auto make_literal(T value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = std::move(value)};
        return expr;
    }

    auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->height = operand->height + 1;
        node->node = UnaryExpr{.op = op, .operand = std::move(operand)};
        return checked(std::move(node));
    }

    auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->height = std::max(left->height, right->height) + 1;
        node->node = BinaryExpr{
            .op = op,
            .left = std::move(left),
            .right = std::move(right),
        };
        return checked(std::move(node));
    }

    // Rejects a node once the tree grows past kMaxTreeHeight. Long operator
    // chains are built by loops, so the nesting guard alone does not bound them.
    auto checked(ExprPtr node) -> ExprPtr {
        if (node->height > kMaxTreeHeight) {
            return too_deep();
        }
        return node;
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    std::size_t depth_ = 0;
    ParseError error_{};
};

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("{}:{}: {}", line, column, message);
}

auto parse(std::string_view source) -> ParseResult {
    Parser parser(tokenize(source));
    return parser.parse_formula();
}

}  // namespace sphere::parser
