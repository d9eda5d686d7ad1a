#pragma once
#include <rendertree/tree/ArrayRange.hpp>

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace RT {

/**
 * Append-only growable array addressed by index.
 *
 * Items are only ever added at the end. replace() is the single in-place
 * mutation and exists so that container frames can have their subtree
 * length stamped once they close. Views returned by toRange() are
 * invalidated by any append() or clear().
 */
template <typename T>
class ArrayBuilder {
public:
    static constexpr auto DEFAULT_CAPACITY = 10uz;

    ArrayBuilder() : ArrayBuilder(DEFAULT_CAPACITY) {}

    explicit ArrayBuilder(std::size_t initialCapacity) {
        this->items.reserve(initialCapacity);
    }

    auto append(T const& item) -> void {
        this->items.push_back(item);
    }

    auto append(T&& item) -> void {
        this->items.push_back(std::move(item));
    }

    [[nodiscard]] auto at(std::size_t index) const -> T const& {
        if (index >= this->items.size()) {
            throw std::out_of_range("ArrayBuilder index out of bounds");
        }
        return this->items[index];
    }

    auto replace(std::size_t index, T item) -> void {
        if (index >= this->items.size()) {
            throw std::out_of_range("ArrayBuilder index out of bounds");
        }
        this->items[index] = std::move(item);
    }

    [[nodiscard]] auto count() const noexcept -> std::size_t {
        return this->items.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t {
        return this->items.capacity();
    }

    // Keeps the allocation so the next render pass can reuse it.
    auto clear() noexcept -> void {
        this->items.clear();
    }

    [[nodiscard]] auto toRange() const noexcept -> ArrayRange<T> {
        return ArrayRange<T>{this->items.data(), this->items.size()};
    }

private:
    std::vector<T> items;
};

} // namespace RT
