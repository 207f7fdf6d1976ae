#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace sphere {

/// Numeric whole-column value seen by formulas.
///
/// Vectors are assembled from rows (one element per row) or supplied
/// directly by the caller. NaN marks a missing element: aggregates skip
/// it, elementwise arithmetic carries it through.
class Vector {
   public:
    using value_type = double;
    using size_type = std::size_t;

    Vector() = default;
    explicit Vector(std::vector<double> data) : data_(std::move(data)) {}
    Vector(std::initializer_list<double> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked element access.
    [[nodiscard]] auto at(size_type idx) const -> double { return data_.at(idx); }
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> double { return data_[idx]; }

    [[nodiscard]] auto values() const noexcept -> std::span<const double> { return data_; }

    void push_back(double value) { data_.push_back(value); }
    void reserve(size_type capacity) { data_.reserve(capacity); }
    void clear() noexcept { data_.clear(); }

    /// Call fn(x) for every element that is not NaN.
    template <std::invocable<double> F>
    void for_each_present(F fn) const {
        for (double x : data_) {
            if (!std::isnan(x)) {
                fn(x);
            }
        }
    }

    /// Number of elements that are not NaN.
    [[nodiscard]] auto present_count() const noexcept -> size_type {
        size_type count = 0;
        for_each_present([&](double) { ++count; });
        return count;
    }

    /// Sum of the elements that are not NaN (0 when there are none).
    [[nodiscard]] auto present_sum() const noexcept -> double {
        double total = 0.0;
        for_each_present([&](double x) { total += x; });
        return total;
    }

    /// Elementwise transform into a new vector of the same length.
    template <std::invocable<double> F>
    [[nodiscard]] auto map(F fn) const -> Vector {
        std::vector<double> out;
        out.reserve(data_.size());
        for (double x : data_) {
            out.push_back(static_cast<double>(fn(x)));
        }
        return Vector{std::move(out)};
    }

    friend auto operator==(const Vector&, const Vector&) -> bool = default;

    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<double> data_;
};

}  // namespace sphere
