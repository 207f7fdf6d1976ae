#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sphere {

enum class ErrorKind : std::uint8_t {
    Syntax,
    UnknownVariable,
    UnknownFunction,
    InvalidCallTarget,
    UnsupportedExpression,
    Shape,
    Arity,
    Type,
};

/// Error raised while compiling or evaluating a single formula.
///
/// Every error is terminal for the formula/row that produced it; nothing
/// is retried.
struct FormulaError {
    ErrorKind kind = ErrorKind::Syntax;
    std::string message;
    /// Formula text the error belongs to, when known.
    std::string formula;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) -> FormulaError;

}  // namespace sphere
