#pragma once

#include <sphere/core/error.hpp>
#include <sphere/core/value.hpp>

#include <fmt/core.h>

#include <expected>
#include <string_view>

namespace sphere::runtime {

/// Apply a numeric binary operation with vector broadcasting.
///
/// scalar op scalar -> scalar; vector op scalar (either side) -> vector;
/// vector op vector -> vector, lengths must match. Booleans count as 0/1.
/// Null and non-numeric operands must be handled by the caller.
template <typename Op>
[[nodiscard]] auto broadcast(const Value& lhs, const Value& rhs, Op op, std::string_view what)
    -> std::expected<Value, FormulaError> {
    const auto* lvec = std::get_if<Vector>(&lhs);
    const auto* rvec = std::get_if<Vector>(&rhs);
    if (lvec == nullptr && rvec == nullptr) {
        auto l = as_number(lhs);
        auto r = as_number(rhs);
        if (!l.has_value() || !r.has_value()) {
            return std::unexpected(make_error(
                ErrorKind::Type, fmt::format("unsupported operand kinds for {}: {} and {}", what,
                                             kind_name(kind_of(lhs)), kind_name(kind_of(rhs)))));
        }
        return Value{op(*l, *r)};
    }
    if (lvec != nullptr && rvec != nullptr) {
        if (lvec->size() != rvec->size()) {
            return std::unexpected(make_error(
                ErrorKind::Shape, fmt::format("operands of {} have different lengths ({} and {})",
                                              what, lvec->size(), rvec->size())));
        }
        Vector out;
        out.reserve(lvec->size());
        for (std::size_t i = 0; i < lvec->size(); ++i) {
            out.push_back(op((*lvec)[i], (*rvec)[i]));
        }
        return Value{std::move(out)};
    }
    const Vector& vec = lvec != nullptr ? *lvec : *rvec;
    const Value& other = lvec != nullptr ? rhs : lhs;
    auto scalar = as_number(other);
    if (!scalar.has_value()) {
        return std::unexpected(make_error(
            ErrorKind::Type, fmt::format("unsupported operand kinds for {}: vector and {}", what,
                                         kind_name(kind_of(other)))));
    }
    Vector out;
    out.reserve(vec.size());
    for (double element : vec) {
        out.push_back(lvec != nullptr ? op(element, *scalar) : op(*scalar, element));
    }
    return Value{std::move(out)};
}

}  // namespace sphere::runtime
