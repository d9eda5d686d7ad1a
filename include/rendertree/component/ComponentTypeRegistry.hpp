#pragma once
#include <rendertree/component/ComponentType.hpp>
#include <rendertree/core/Error.hpp>

#include <parallel_hashmap/phmap.h>

#include <memory>
#include <string>
#include <string_view>

namespace RT {

/**
 * Name to ComponentType lookup used when a renderer has to resolve a
 * component identifier it did not construct itself.
 */
class ComponentTypeRegistry {
public:
    template <ConcreteComponent T>
    [[nodiscard]] auto add(std::string name) -> Expected<void> {
        return this->add(ComponentType::of<T>(std::move(name)));
    }

    // Re-registering a name with the same type is a no-op.
    [[nodiscard]] auto add(ComponentType type) -> Expected<void>;

    [[nodiscard]] auto find(std::string_view name) const -> Expected<ComponentType>;
    [[nodiscard]] auto instantiate(std::string_view name) const -> Expected<std::unique_ptr<Component>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return this->types.size();
    }

    auto clear() -> void {
        this->types.clear();
    }

private:
    phmap::flat_hash_map<std::string, ComponentType> types;
};

} // namespace RT
