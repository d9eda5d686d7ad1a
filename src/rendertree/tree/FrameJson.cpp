#include <rendertree/tree/FrameJson.hpp>

#include <string>

namespace RT::Json {

auto attributeValueToJson(AttributeValue const& value) -> nlohmann::json {
    switch (attributeValueKind(value)) {
    case AttributeValueKind::String:
        return std::get<std::string>(value);
    case AttributeValueKind::Handler:
        return "<handler>";
    case AttributeValueKind::Opaque:
        return nlohmann::json{{"opaque", std::string(std::get<OpaqueValue>(value).typeName())}};
    }
    return nullptr;
}

auto frameToJson(RenderTreeFrame const& frame) -> nlohmann::json {
    nlohmann::json json{{"type", frameTypeName(frame.type())}, {"sequence", frame.sequence()}};
    switch (frame.type()) {
    case FrameType::Element:
        json["name"]           = frame.name();
        json["subtree_length"] = frame.subtreeLength();
        break;
    case FrameType::Text:
        json["text"] = frame.textContent();
        break;
    case FrameType::Attribute:
        json["name"]  = frame.name();
        json["value"] = attributeValueToJson(frame.attributeValue());
        break;
    case FrameType::Component:
        json["component"]      = frame.componentType().name();
        json["subtree_length"] = frame.subtreeLength();
        break;
    case FrameType::Region:
        json["subtree_length"] = frame.subtreeLength();
        break;
    }
    return json;
}

auto framesToJson(ArrayRange<RenderTreeFrame> frames) -> nlohmann::json {
    auto json = nlohmann::json::array();
    for (auto const& frame : frames) {
        json.push_back(frameToJson(frame));
    }
    return json;
}

} // namespace RT::Json
