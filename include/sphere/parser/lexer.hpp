#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace sphere::parser {

/// Token types for the formula lexer.
///
/// The lexer recognises more than the grammar accepts (`%`, `and`, `lambda`,
/// ...) so the parser can reject those constructs as unsupported rather than
/// as generic syntax errors.
enum class TokenKind : std::uint8_t {
    // Literals
    NumberLiteral,
    StringLiteral,
    BoolLiteral,
    NoneLiteral,

    Identifier,

    // Keywords outside the grammar
    KeywordAnd,
    KeywordOr,
    KeywordNot,
    KeywordIn,
    KeywordIs,
    KeywordIf,
    KeywordElse,
    KeywordLambda,

    // Comparison operators
    EqEq,    // ==
    BangEq,  // !=
    Lt,      // <
    Le,      // <=
    Gt,      // >
    Ge,      // >=

    // Arithmetic operators
    Plus,      // +
    Minus,     // -
    Star,      // *
    StarStar,  // **
    Slash,     // /

    // Operators outside the grammar
    SlashSlash,  // //
    Percent,     // %
    Caret,       // ^
    Amp,         // &
    Pipe,        // |
    Tilde,       // ~
    At,          // @

    // Delimiters
    Eq,        // =
    LParen,    // (
    RParen,    // )
    LBracket,  // [
    RBracket,  // ]
    LBrace,    // {
    RBrace,    // }
    Comma,     // ,
    Dot,       // .
    Colon,     // :

    // Special
    Eof,
    Error,
};

/// A single token with source location.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t line = 0;
    std::size_t column = 0;
};

/// Tokenize a formula string.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace sphere::parser
