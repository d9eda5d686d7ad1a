#pragma once
#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>

namespace RT {

/**
 * Borrowed, read-only view over the first count() items of an ArrayBuilder.
 * Valid until the owning builder is mutated or cleared.
 */
template <typename T>
class ArrayRange {
public:
    using value_type     = T;
    using const_iterator = T const*;

    ArrayRange() = default;
    ArrayRange(T const* items, std::size_t count) : items_(items), count_(count) {}

    [[nodiscard]] auto count() const noexcept -> std::size_t {
        return this->count_;
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return this->count_ == 0uz;
    }

    [[nodiscard]] auto operator[](std::size_t index) const -> T const& {
        return this->items_[index];
    }

    [[nodiscard]] auto at(std::size_t index) const -> T const& {
        if (index >= this->count_) {
            throw std::out_of_range("ArrayRange index out of bounds");
        }
        return this->items_[index];
    }

    [[nodiscard]] auto begin() const noexcept -> const_iterator {
        return this->items_;
    }

    [[nodiscard]] auto end() const noexcept -> const_iterator {
        return this->items_ + this->count_;
    }

    [[nodiscard]] auto span() const noexcept -> std::span<T const> {
        return std::span<T const>{this->items_, this->count_};
    }

    friend auto operator==(ArrayRange const& lhs, ArrayRange const& rhs) -> bool {
        return std::ranges::equal(lhs.span(), rhs.span());
    }

private:
    T const*    items_ = nullptr;
    std::size_t count_ = 0uz;
};

} // namespace RT
