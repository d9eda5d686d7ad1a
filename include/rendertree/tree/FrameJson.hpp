#pragma once
#include <rendertree/tree/ArrayRange.hpp>
#include <rendertree/tree/RenderTreeFrame.hpp>

#include <nlohmann/json.hpp>

namespace RT::Json {

[[nodiscard]] auto attributeValueToJson(AttributeValue const& value) -> nlohmann::json;
[[nodiscard]] auto frameToJson(RenderTreeFrame const& frame) -> nlohmann::json;
[[nodiscard]] auto framesToJson(ArrayRange<RenderTreeFrame> frames) -> nlohmann::json;

} // namespace RT::Json
