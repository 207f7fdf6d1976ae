#include <sphere/core/error.hpp>

#include <fmt/core.h>

namespace sphere {

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::Syntax:
            return "SyntaxError";
        case ErrorKind::UnknownVariable:
            return "UnknownVariable";
        case ErrorKind::UnknownFunction:
            return "UnknownFunction";
        case ErrorKind::InvalidCallTarget:
            return "InvalidCallTarget";
        case ErrorKind::UnsupportedExpression:
            return "UnsupportedExpression";
        case ErrorKind::Shape:
            return "ShapeError";
        case ErrorKind::Arity:
            return "ArityError";
        case ErrorKind::Type:
            return "TypeError";
    }
    return "Error";
}

auto make_error(ErrorKind kind, std::string message) -> FormulaError {
    return FormulaError{.kind = kind, .message = std::move(message), .formula = {}};
}

auto FormulaError::format() const -> std::string {
    if (formula.empty()) {
        return fmt::format("{}: {}", error_kind_name(kind), message);
    }
    return fmt::format("{}: {} (in '{}')", error_kind_name(kind), message, formula);
}

}  // namespace sphere
