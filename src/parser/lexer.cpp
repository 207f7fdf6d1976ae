#include <sphere/parser/lexer.hpp>

#include <cctype>
#include <unordered_map>

namespace sphere::parser {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length,
                               std::size_t line, std::size_t column) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .line = line,
            .column = column,
        });
    };

    const std::unordered_map<std::string_view, TokenKind> keywords = {
        {"True", TokenKind::BoolLiteral},   {"False", TokenKind::BoolLiteral},
        {"true", TokenKind::BoolLiteral},   {"false", TokenKind::BoolLiteral},
        {"None", TokenKind::NoneLiteral},   {"and", TokenKind::KeywordAnd},
        {"or", TokenKind::KeywordOr},       {"not", TokenKind::KeywordNot},
        {"in", TokenKind::KeywordIn},       {"is", TokenKind::KeywordIs},
        {"if", TokenKind::KeywordIf},       {"else", TokenKind::KeywordElse},
        {"lambda", TokenKind::KeywordLambda},
    };

    const auto is_ident_start = [](unsigned char ch) -> bool {
        return std::isalpha(ch) != 0 || ch == '_';
    };

    const auto is_ident_cont = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_';
    };

    const auto is_digit = [](char ch) -> bool {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    };

    std::size_t i = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };
    const auto peek = [&](std::size_t offset = 0) -> char {
        if (i + offset >= source.size()) {
            return '\0';
        }
        return source[i + offset];
    };
    const auto advance = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        char ch = source[i++];
        if (ch == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        return ch;
    };

    const auto match = [&](char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        advance();
        return true;
    };

    // Digits with optional '_' separators between them.
    const auto consume_digits = [&]() {
        while (is_digit(peek()) || (peek() == '_' && is_digit(peek(1)))) {
            advance();
        }
    };

    while (!at_end()) {
        char ws = peek();
        if (ws == ' ' || ws == '\r' || ws == '\t' || ws == '\n') {
            advance();
            continue;
        }

        std::size_t token_start = i;
        std::size_t token_line = line;
        std::size_t token_column = column;
        char ch = advance();

        if (is_ident_start(static_cast<unsigned char>(ch))) {
            while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                advance();
            }
            std::string_view text = source.substr(token_start, i - token_start);
            if (auto it = keywords.find(text); it != keywords.end()) {
                add_token(it->second, token_start, i - token_start, token_line, token_column);
                continue;
            }
            add_token(TokenKind::Identifier, token_start, i - token_start, token_line,
                      token_column);
            continue;
        }

        if (is_digit(ch) || (ch == '.' && is_digit(peek()))) {
            if (ch != '.') {
                consume_digits();
                if (peek() == '.') {
                    advance();
                }
            }
            consume_digits();
            if ((peek() == 'e' || peek() == 'E') &&
                (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
                advance();
                if (peek() == '+' || peek() == '-') {
                    advance();
                }
                consume_digits();
            }
            if (is_ident_start(static_cast<unsigned char>(peek()))) {
                // 12abc: a number glued to a name is not a valid token.
                while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                    advance();
                }
                add_token(TokenKind::Error, token_start, i - token_start, token_line,
                          token_column);
                continue;
            }
            add_token(TokenKind::NumberLiteral, token_start, i - token_start, token_line,
                      token_column);
            continue;
        }

        switch (ch) {
            case '"':
            case '\'': {
                const char quote = ch;
                while (!at_end() && peek() != quote && peek() != '\n') {
                    if (peek() == '\\' && peek(1) != '\0') {
                        advance();
                    }
                    advance();
                }
                if (peek() != quote) {
                    add_token(TokenKind::Error, token_start, i - token_start, token_line,
                              token_column);
                    continue;
                }
                advance();
                add_token(TokenKind::StringLiteral, token_start, i - token_start, token_line,
                          token_column);
                continue;
            }
            case '+':
                add_token(TokenKind::Plus, token_start, 1, token_line, token_column);
                continue;
            case '-':
                add_token(TokenKind::Minus, token_start, 1, token_line, token_column);
                continue;
            case '*':
                if (match('*')) {
                    add_token(TokenKind::StarStar, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Star, token_start, 1, token_line, token_column);
                }
                continue;
            case '/':
                if (match('/')) {
                    add_token(TokenKind::SlashSlash, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Slash, token_start, 1, token_line, token_column);
                }
                continue;
            case '%':
                add_token(TokenKind::Percent, token_start, 1, token_line, token_column);
                continue;
            case '!':
                if (match('=')) {
                    add_token(TokenKind::BangEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '=':
                if (match('=')) {
                    add_token(TokenKind::EqEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Eq, token_start, 1, token_line, token_column);
                }
                continue;
            case '<':
                if (match('=')) {
                    add_token(TokenKind::Le, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Lt, token_start, 1, token_line, token_column);
                }
                continue;
            case '>':
                if (match('=')) {
                    add_token(TokenKind::Ge, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Gt, token_start, 1, token_line, token_column);
                }
                continue;
            case '^':
                add_token(TokenKind::Caret, token_start, 1, token_line, token_column);
                continue;
            case '&':
                add_token(TokenKind::Amp, token_start, 1, token_line, token_column);
                continue;
            case '|':
                add_token(TokenKind::Pipe, token_start, 1, token_line, token_column);
                continue;
            case '~':
                add_token(TokenKind::Tilde, token_start, 1, token_line, token_column);
                continue;
            case '@':
                add_token(TokenKind::At, token_start, 1, token_line, token_column);
                continue;
            case '(':
                add_token(TokenKind::LParen, token_start, 1, token_line, token_column);
                continue;
            case ')':
                add_token(TokenKind::RParen, token_start, 1, token_line, token_column);
                continue;
            case '[':
                add_token(TokenKind::LBracket, token_start, 1, token_line, token_column);
                continue;
            case ']':
                add_token(TokenKind::RBracket, token_start, 1, token_line, token_column);
                continue;
            case '{':
                add_token(TokenKind::LBrace, token_start, 1, token_line, token_column);
                continue;
            case '}':
                add_token(TokenKind::RBrace, token_start, 1, token_line, token_column);
                continue;
            case ',':
                add_token(TokenKind::Comma, token_start, 1, token_line, token_column);
                continue;
            case '.':
                add_token(TokenKind::Dot, token_start, 1, token_line, token_column);
                continue;
            case ':':
                add_token(TokenKind::Colon, token_start, 1, token_line, token_column);
                continue;
            default:
                add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                continue;
        }
    }

    tokens.push_back(Token{
        .kind = TokenKind::Eof,
        .lexeme = source.substr(source.size(), 0),
        .line = line,
        .column = column,
    });
    return tokens;
}

}  // namespace sphere::parser
