#include <rendertree/tree/RenderTreeFrame.hpp>

namespace RT {

auto frameTypeName(FrameType type) -> std::string_view {
    switch (type) {
    case FrameType::Element:
        return "Element";
    case FrameType::Text:
        return "Text";
    case FrameType::Attribute:
        return "Attribute";
    case FrameType::Component:
        return "Component";
    case FrameType::Region:
        return "Region";
    }
    return "Unknown";
}

auto RenderTreeFrame::element(int sequence, std::string elementName) -> RenderTreeFrame {
    RenderTreeFrame frame{FrameType::Element, sequence, 0};
    frame.name_ = std::move(elementName);
    return frame;
}

auto RenderTreeFrame::text(int sequence, std::string textContent) -> RenderTreeFrame {
    RenderTreeFrame frame{FrameType::Text, sequence, 1};
    frame.text_ = std::move(textContent);
    return frame;
}

auto RenderTreeFrame::attributeWithStringValue(int sequence, std::string name, std::string value) -> RenderTreeFrame {
    RenderTreeFrame frame{FrameType::Attribute, sequence, 1};
    frame.name_  = std::move(name);
    frame.value_ = std::move(value);
    return frame;
}

auto RenderTreeFrame::attributeWithHandler(int sequence, std::string name, EventHandler handler) -> RenderTreeFrame {
    RenderTreeFrame frame{FrameType::Attribute, sequence, 1};
    frame.name_  = std::move(name);
    frame.value_ = std::move(handler);
    return frame;
}

auto RenderTreeFrame::attributeWithOpaqueValue(int sequence, std::string name, OpaqueValue value) -> RenderTreeFrame {
    RenderTreeFrame frame{FrameType::Attribute, sequence, 1};
    frame.name_  = std::move(name);
    frame.value_ = std::move(value);
    return frame;
}

auto RenderTreeFrame::childComponent(int sequence, ComponentType componentType) -> RenderTreeFrame {
    RenderTreeFrame frame{FrameType::Component, sequence, 0};
    frame.componentType_ = std::move(componentType);
    return frame;
}

auto RenderTreeFrame::region(int sequence) -> RenderTreeFrame {
    return RenderTreeFrame{FrameType::Region, sequence, 0};
}

auto RenderTreeFrame::withSubtreeLength(int subtreeLength) const -> Expected<RenderTreeFrame> {
    if (!isContainer(this->type_)) {
        return std::unexpected(Error{Error::Code::WrongFrameKind,
                                     "subtree length can only be set on Element, Component or Region frames, not "
                                         + std::string(frameTypeName(this->type_))});
    }
    auto copy           = *this;
    copy.subtreeLength_ = subtreeLength;
    return copy;
}

auto RenderTreeFrame::withAttributeSequence(int sequence) const -> Expected<RenderTreeFrame> {
    if (this->type_ != FrameType::Attribute) {
        return std::unexpected(Error{Error::Code::WrongFrameKind,
                                     "frame type must be Attribute, not " + std::string(frameTypeName(this->type_))});
    }
    auto copy      = *this;
    copy.sequence_ = sequence;
    return copy;
}

auto operator==(RenderTreeFrame const& lhs, RenderTreeFrame const& rhs) -> bool {
    return lhs.type_ == rhs.type_
           && lhs.sequence_ == rhs.sequence_
           && lhs.subtreeLength_ == rhs.subtreeLength_
           && lhs.name_ == rhs.name_
           && lhs.text_ == rhs.text_
           && lhs.value_ == rhs.value_
           && lhs.componentType_ == rhs.componentType_;
}

} // namespace RT
