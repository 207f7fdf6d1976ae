#pragma once

#include <sphere/core/error.hpp>
#include <sphere/parser/ast.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace sphere::parser {

/// Parse error with location information.
struct ParseError {
    /// Syntax, InvalidCallTarget or UnsupportedExpression.
    ErrorKind kind = ErrorKind::Syntax;
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for parse operations.
using ParseResult = std::expected<ExprPtr, ParseError>;

/// Parse a single formula expression. Trailing input is an error.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

}  // namespace sphere::parser
