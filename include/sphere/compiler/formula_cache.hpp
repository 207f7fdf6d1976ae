#pragma once

#include <sphere/compiler/formula.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <string_view>

namespace sphere {

/// Bounded least-recently-used cache of compiled formulas keyed by text.
///
/// All members are safe to call concurrently. Entries are handed out as
/// shared pointers, so evicting an entry never invalidates a tree another
/// caller is still evaluating.
class FormulaCache {
   public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    /// A capacity of zero disables caching: every lookup misses.
    explicit FormulaCache(std::size_t capacity = kDefaultCapacity);

    FormulaCache(const FormulaCache&) = delete;
    auto operator=(const FormulaCache&) -> FormulaCache& = delete;

    /// Look up `text`, marking it most recently used. nullptr on a miss.
    [[nodiscard]] auto find(std::string_view text) -> FormulaPtr;

    /// Insert a freshly compiled formula and return the resident entry. When
    /// another caller inserted the same text first, that entry wins.
    auto insert(FormulaPtr formula) -> FormulaPtr;

    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto hits() const -> std::size_t;
    [[nodiscard]] auto misses() const -> std::size_t;
    [[nodiscard]] auto evictions() const -> std::size_t;

   private:
    using LruList = std::list<FormulaPtr>;

    std::size_t capacity_;
    mutable std::mutex mutex_;
    // Front is the most recently used entry.
    LruList lru_;
    robin_hood::unordered_flat_map<std::string, LruList::iterator> index_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
    std::size_t evictions_ = 0;
};

}  // namespace sphere
