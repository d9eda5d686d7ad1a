#pragma once
#include <rendertree/core/Error.hpp>

#include <concepts>
#include <type_traits>

namespace RT {

class RenderTreeBuilder;

/**
 * A UI component describes its output by driving the builder it is handed.
 * There is no ambient "current" builder; every render invocation receives
 * the instance it must write to.
 */
class Component {
public:
    virtual ~Component() = default;

    virtual auto buildRenderTree(RenderTreeBuilder& builder) -> Expected<void> = 0;
};

template <typename T>
concept ConcreteComponent = std::derived_from<T, Component>
                            && !std::is_abstract_v<T>
                            && std::default_initializable<T>;

} // namespace RT
