#include <sphere/compiler/compiler.hpp>
#include <sphere/parser/parser.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cstdint>
#include <utility>

namespace sphere {

namespace {

struct NamedEntity {
    std::string_view name;
    char value;
};

constexpr std::array<NamedEntity, 5> kNamedEntities = {{
    {"lt", '<'},
    {"gt", '>'},
    {"amp", '&'},
    {"quot", '"'},
    {"apos", '\''},
}};

void append_utf8(std::string& out, std::uint32_t code) {
    if (code < 0x80) {
        out.push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

// Decodes the entity body between '&' and ';'. Returns false when unknown.
auto decode_entity(std::string_view body, std::string& out) -> bool {
    if (body.size() >= 2 && body[0] == '#') {
        int base = 10;
        std::string_view digits = body.substr(1);
        if (digits.front() == 'x' || digits.front() == 'X') {
            base = 16;
            digits = digits.substr(1);
        }
        if (digits.empty()) {
            return false;
        }
        std::uint32_t code = 0;
        auto result = std::from_chars(digits.data(), digits.data() + digits.size(), code, base);
        if (result.ec != std::errc() || result.ptr != digits.data() + digits.size() ||
            code > 0x10FFFF) {
            return false;
        }
        append_utf8(out, code);
        return true;
    }
    for (const auto& entity : kNamedEntities) {
        if (entity.name == body) {
            out.push_back(entity.value);
            return true;
        }
    }
    return false;
}

}  // namespace

auto unescape_markup(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            auto semi = text.find(';', i + 1);
            if (semi != std::string_view::npos && semi - i <= 10 &&
                decode_entity(text.substr(i + 1, semi - i - 1), out)) {
                i = semi + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        i += 1;
    }
    return out;
}

Compiler::Compiler() : Compiler(CompilerOptions{}) {}

Compiler::Compiler(const CompilerOptions& options)
    : cache_(std::make_shared<FormulaCache>(options.cache_capacity)) {}

Compiler::Compiler(std::shared_ptr<FormulaCache> cache) : cache_(std::move(cache)) {}

auto Compiler::compile(std::string_view text) const -> CompileResult {
    std::string source = unescape_markup(text);
    if (auto cached = cache_->find(source)) {
        return cached;
    }
    auto parsed = parser::parse(source);
    if (!parsed) {
        const auto& error = parsed.error();
        return std::unexpected(FormulaError{
            .kind = error.kind,
            .message = error.format(),
            .formula = std::move(source),
        });
    }
    auto formula = std::make_shared<const CompiledFormula>(std::move(source), std::move(*parsed));
    return cache_->insert(std::move(formula));
}

}  // namespace sphere
