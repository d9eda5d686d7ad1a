#include <rendertree/component/RenderPass.hpp>

#include "log/TaggedLogger.hpp"

namespace RT {

auto renderComponent(Component& component, RenderTreeBuilder& builder) -> Expected<ArrayRange<RenderTreeFrame>> {
    builder.clear();
    if (auto built = component.buildRenderTree(builder); !built) {
        rt_log("Render pass failed: " + describeError(built.error()), "RenderPass", "ERROR");
        return std::unexpected(built.error());
    }
    return builder.finish();
}

} // namespace RT
