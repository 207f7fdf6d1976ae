#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace sphere {

struct NamedFormula {
    std::string target;
    std::string text;
};

/// Target column -> formula text, in insertion order.
///
/// Insertion order is the evaluation order: a formula may refer to targets
/// declared before it. Re-assigning a target replaces its text in place and
/// keeps its original position.
class FormulaBatch {
   public:
    using const_iterator = std::vector<NamedFormula>::const_iterator;

    FormulaBatch() = default;
    FormulaBatch(std::initializer_list<std::pair<std::string, std::string>> init);

    void insert_or_assign(std::string target, std::string text);

    /// Formula text for `target`, or nullptr.
    [[nodiscard]] auto find(const std::string& target) const -> const std::string*;
    [[nodiscard]] auto contains(const std::string& target) const -> bool {
        return find(target) != nullptr;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto operator[](std::size_t idx) const -> const NamedFormula& {
        return entries_[idx];
    }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.end(); }

    void clear() noexcept { entries_.clear(); }

   private:
    std::vector<NamedFormula> entries_;
};

}  // namespace sphere
