#include <sphere/compiler/compiler.hpp>
#include <sphere/compiler/formula_cache.hpp>
#include <sphere/runtime/evaluator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using sphere::Compiler;
using sphere::FormulaCache;

TEST_CASE("Compiling the same text twice returns the cached tree", "[cache]") {
    Compiler compiler;
    auto first = compiler.compile("price * qty");
    auto second = compiler.compile("price * qty");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->get() == second->get());
    REQUIRE(compiler.cache().size() == 1);
    REQUIRE(compiler.cache().hits() == 1);
    REQUIRE(compiler.cache().misses() == 1);
}

TEST_CASE("Cached and fresh trees evaluate identically", "[cache]") {
    Compiler cached;
    Compiler uncached(sphere::CompilerOptions{.cache_capacity = 0});
    sphere::Row row{{"a", 3.0}, {"b", 4.0}};
    for (int i = 0; i < 3; ++i) {
        auto x = sphere::runtime::run_formula(cached, "sqrt(a ** 2 + b ** 2)", row);
        auto y = sphere::runtime::run_formula(uncached, "sqrt(a ** 2 + b ** 2)", row);
        REQUIRE(x.has_value());
        REQUIRE(y.has_value());
        REQUIRE(*x == *y);
        REQUIRE(std::get<double>(*x) == 5.0);
    }
    REQUIRE(uncached.cache().size() == 0);
}

TEST_CASE("Markup-escaped and plain text share one entry", "[cache]") {
    Compiler compiler;
    auto escaped = compiler.compile("a &lt; b");
    auto plain = compiler.compile("a < b");
    REQUIRE(escaped.has_value());
    REQUIRE(plain.has_value());
    REQUIRE(escaped->get() == plain->get());
    REQUIRE(compiler.cache().size() == 1);
}

TEST_CASE("Failed compilations are not cached", "[cache]") {
    Compiler compiler;
    auto result = compiler.compile("a +");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == sphere::ErrorKind::Syntax);
    REQUIRE(result.error().formula == "a +");
    REQUIRE(compiler.cache().size() == 0);
}

TEST_CASE("Least recently used entry is evicted first", "[cache]") {
    auto cache = std::make_shared<FormulaCache>(2);
    Compiler compiler(cache);

    auto a = compiler.compile("a");
    REQUIRE(compiler.compile("b").has_value());
    REQUIRE(compiler.compile("a").has_value());  // a is now most recent
    REQUIRE(compiler.compile("c").has_value());  // evicts b

    REQUIRE(cache->size() == 2);
    REQUIRE(cache->evictions() == 1);
    REQUIRE(cache->find("b") == nullptr);
    REQUIRE(cache->find("a") != nullptr);
    REQUIRE(cache->find("c") != nullptr);

    // Eviction drops only the cache's reference.
    cache->clear();
    REQUIRE(cache->size() == 0);
    REQUIRE(a.has_value());
    REQUIRE((*a)->text() == "a");
}

TEST_CASE("A very large capacity is not allocated up front", "[cache]") {
    constexpr auto kHuge = std::numeric_limits<std::size_t>::max();
    auto cache = std::make_shared<FormulaCache>(kHuge);
    REQUIRE(cache->capacity() == kHuge);

    Compiler compiler(cache);
    REQUIRE(compiler.compile("price * qty").has_value());
    REQUIRE(compiler.compile("price * qty").has_value());
    REQUIRE(cache->size() == 1);
    REQUIRE(cache->hits() == 1);
}

TEST_CASE("Insert keeps the entry that arrived first", "[cache]") {
    FormulaCache cache(4);
    Compiler uncached(sphere::CompilerOptions{.cache_capacity = 0});
    auto first = uncached.compile("x + 1");
    auto second = uncached.compile("x + 1");
    REQUIRE(first->get() != second->get());

    auto resident = cache.insert(*first);
    auto again = cache.insert(*second);
    REQUIRE(resident.get() == first->get());
    REQUIRE(again.get() == first->get());
    REQUIRE(cache.size() == 1);
}

TEST_CASE("Concurrent compiles share one tree per text", "[cache][threads]") {
    auto cache = std::make_shared<FormulaCache>(16);
    constexpr int kThreads = 8;
    constexpr int kIterations = 200;
    std::vector<const sphere::CompiledFormula*> seen(kThreads, nullptr);
    std::atomic<int> failures{0};

    std::vector<std::thread> workers;
    workers.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            Compiler compiler(cache);
            for (int i = 0; i < kIterations; ++i) {
                auto formula = compiler.compile("DOT(price, qty) + " + std::to_string(i % 4));
                if (!formula) {
                    failures += 1;
                    continue;
                }
                if (i % 4 == 0) {
                    seen[t] = formula->get();
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(failures == 0);
    REQUIRE(cache->size() == 4);
    for (int t = 1; t < kThreads; ++t) {
        REQUIRE(seen[t] == seen[0]);
    }
}
