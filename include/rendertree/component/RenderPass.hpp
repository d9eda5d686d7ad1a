#pragma once
#include <rendertree/component/Component.hpp>
#include <rendertree/core/Error.hpp>
#include <rendertree/tree/ArrayRange.hpp>
#include <rendertree/tree/RenderTreeBuilder.hpp>

namespace RT {

// Clears the builder, lets the component describe itself into it, and
// returns the finished frames. Any builder failure ends the pass.
[[nodiscard]] auto renderComponent(Component& component, RenderTreeBuilder& builder) -> Expected<ArrayRange<RenderTreeFrame>>;

} // namespace RT
