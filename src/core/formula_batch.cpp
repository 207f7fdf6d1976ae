#include <sphere/core/formula_batch.hpp>

#include <algorithm>

namespace sphere {

FormulaBatch::FormulaBatch(std::initializer_list<std::pair<std::string, std::string>> init) {
    for (const auto& [target, text] : init) {
        insert_or_assign(target, text);
    }
}

void FormulaBatch::insert_or_assign(std::string target, std::string text) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const NamedFormula& entry) { return entry.target == target; });
    if (it != entries_.end()) {
        it->text = std::move(text);
        return;
    }
    entries_.push_back(NamedFormula{.target = std::move(target), .text = std::move(text)});
}

auto FormulaBatch::find(const std::string& target) const -> const std::string* {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const NamedFormula& entry) { return entry.target == target; });
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->text;
}

}  // namespace sphere
