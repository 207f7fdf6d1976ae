#include <sphere/compiler/formula_cache.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sphere {

// The index grows on demand past the default size, so a large configured
// capacity costs nothing until it is used.
FormulaCache::FormulaCache(std::size_t capacity) : capacity_(capacity) {
    index_.reserve(std::min(capacity_, kDefaultCapacity));
}

auto FormulaCache::find(std::string_view text) -> FormulaPtr {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(std::string(text));
    if (it == index_.end()) {
        misses_ += 1;
        return nullptr;
    }
    hits_ += 1;
    lru_.splice(lru_.begin(), lru_, it->second);
    return *it->second;
}

auto FormulaCache::insert(FormulaPtr formula) -> FormulaPtr {
    if (capacity_ == 0) {
        return formula;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = index_.find(formula->text()); it != index_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second);
        return *it->second;
    }
    while (lru_.size() >= capacity_) {
        const auto& victim = lru_.back();
        spdlog::debug("formula cache: evicting '{}'", victim->text());
        index_.erase(victim->text());
        lru_.pop_back();
        evictions_ += 1;
    }
    lru_.push_front(formula);
    index_.emplace(formula->text(), lru_.begin());
    return formula;
}

void FormulaCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    lru_.clear();
}

auto FormulaCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

auto FormulaCache::hits() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

auto FormulaCache::misses() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

auto FormulaCache::evictions() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

}  // namespace sphere
