#include <sphere/core/value.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <type_traits>
#include <variant>

namespace sphere {

auto kind_of(const Value& value) noexcept -> ValueKind {
    return std::visit(
        [](const auto& v) -> ValueKind {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return ValueKind::Null;
            } else if constexpr (std::is_same_v<T, double>) {
                return ValueKind::Number;
            } else if constexpr (std::is_same_v<T, bool>) {
                return ValueKind::Bool;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ValueKind::String;
            } else {
                return ValueKind::Vector;
            }
        },
        value);
}

auto as_number(const Value& value) noexcept -> std::optional<double> {
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? 1.0 : 0.0;
    }
    return std::nullopt;
}

auto kind_name(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Number:
            return "number";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::String:
            return "string";
        case ValueKind::Vector:
            return "vector";
    }
    return "unknown";
}

auto describe_shape(const Value& value) -> std::string {
    if (const auto* vec = std::get_if<Vector>(&value)) {
        return fmt::format("vector of length {}", vec->size());
    }
    return fmt::format("scalar {}", kind_name(kind_of(value)));
}

auto format_number(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec == std::errc{}) {
        return std::string(buffer.data(), ptr);
    }
    return fmt::format("{}", value);
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "null";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_number(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(format_number(v[i]));
                }
                out.push_back(']');
                return out;
            }
        },
        value);
}

}  // namespace sphere
