#pragma once
#include <rendertree/component/Component.hpp>
#include <rendertree/core/Error.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>

namespace RT {

/**
 * Identifies an instantiable component type inside a Component frame.
 * A default-constructed ComponentType identifies nothing and is rejected
 * by the builder.
 */
class ComponentType {
public:
    using Factory = std::function<std::unique_ptr<Component>()>;

    ComponentType() = default;

    template <ConcreteComponent T>
    [[nodiscard]] static auto of(std::string name = {}) -> ComponentType {
        ComponentType type;
        type.name_    = name.empty() ? std::string(typeid(T).name()) : std::move(name);
        type.type_    = std::type_index(typeid(T));
        type.factory_ = [] { return std::unique_ptr<Component>(std::make_unique<T>()); };
        return type;
    }

    [[nodiscard]] auto valid() const noexcept -> bool {
        return this->type_.has_value() && static_cast<bool>(this->factory_);
    }

    [[nodiscard]] auto name() const noexcept -> std::string const& {
        return this->name_;
    }

    [[nodiscard]] auto typeIndex() const noexcept -> std::optional<std::type_index> {
        return this->type_;
    }

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
        return this->type_ && *this->type_ == std::type_index(typeid(T));
    }

    [[nodiscard]] auto instantiate() const -> Expected<std::unique_ptr<Component>>;

    friend auto operator==(ComponentType const& lhs, ComponentType const& rhs) -> bool {
        return lhs.type_ == rhs.type_;
    }

private:
    std::string                    name_;
    std::optional<std::type_index> type_;
    Factory                        factory_;
};

} // namespace RT
