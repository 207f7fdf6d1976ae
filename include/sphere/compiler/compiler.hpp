#pragma once

#include <sphere/compiler/formula.hpp>
#include <sphere/compiler/formula_cache.hpp>
#include <sphere/core/error.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace sphere {

struct CompilerOptions {
    std::size_t cache_capacity = FormulaCache::kDefaultCapacity;
};

/// Result type for compile operations.
using CompileResult = std::expected<FormulaPtr, FormulaError>;

/// Turns formula text into shared expression trees, memoised through a
/// FormulaCache.
///
/// The cache is injected so several compilers (or threads) can share one; a
/// default-constructed compiler owns a private cache. compile() is safe to
/// call concurrently when the cache is shared.
class Compiler {
   public:
    Compiler();
    explicit Compiler(const CompilerOptions& options);
    explicit Compiler(std::shared_ptr<FormulaCache> cache);

    /// Unescape markup entities, then return the cached tree or parse a new
    /// one. Failures are never cached.
    [[nodiscard]] auto compile(std::string_view text) const -> CompileResult;

    [[nodiscard]] auto cache() const noexcept -> FormulaCache& { return *cache_; }
    [[nodiscard]] auto shared_cache() const noexcept -> const std::shared_ptr<FormulaCache>& {
        return cache_;
    }

   private:
    std::shared_ptr<FormulaCache> cache_;
};

/// Decode `&lt;` `&gt;` `&amp;` `&quot;` `&apos;` and numeric `&#NN;` /
/// `&#xNN;` references. Unrecognised entities are left untouched.
[[nodiscard]] auto unescape_markup(std::string_view text) -> std::string;

}  // namespace sphere
