#pragma once

#include <sphere/parser/ast.hpp>

#include <memory>
#include <string>

namespace sphere {

/// A parsed formula: the (unescaped) source text and its expression tree.
///
/// Immutable after construction and shared read-only between the cache and
/// every caller that compiled the same text.
class CompiledFormula {
   public:
    CompiledFormula(std::string text, parser::ExprPtr root)
        : text_(std::move(text)), root_(std::move(root)) {}

    [[nodiscard]] auto text() const noexcept -> const std::string& { return text_; }
    [[nodiscard]] auto root() const noexcept -> const parser::Expr& { return *root_; }

   private:
    std::string text_;
    parser::ExprPtr root_;
};

using FormulaPtr = std::shared_ptr<const CompiledFormula>;

}  // namespace sphere
