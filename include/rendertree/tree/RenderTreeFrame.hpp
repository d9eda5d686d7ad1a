#pragma once
#include <rendertree/component/ComponentType.hpp>
#include <rendertree/core/Error.hpp>
#include <rendertree/tree/AttributeValue.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace RT {

enum class FrameType : std::uint8_t {
    Element,
    Text,
    Attribute,
    Component,
    Region,
};

[[nodiscard]] auto frameTypeName(FrameType type) -> std::string_view;

// Element, Component and Region frames enclose a span of later frames.
[[nodiscard]] constexpr auto isContainer(FrameType type) noexcept -> bool {
    return type == FrameType::Element || type == FrameType::Component || type == FrameType::Region;
}

/**
 * One node of a linearized render tree.
 *
 * A frame is a value. Once appended to a RenderTreeBuilder it is only ever
 * replaced by a copy with a stamped subtree length when its container closes.
 *
 * Payload accessors return an empty value for kinds that do not carry that
 * payload: name() is the element tag or the attribute name, textContent()
 * is only set on Text frames, and so on.
 */
class RenderTreeFrame {
public:
    [[nodiscard]] static auto element(int sequence, std::string elementName) -> RenderTreeFrame;
    [[nodiscard]] static auto text(int sequence, std::string textContent) -> RenderTreeFrame;
    [[nodiscard]] static auto attributeWithStringValue(int sequence, std::string name, std::string value) -> RenderTreeFrame;
    [[nodiscard]] static auto attributeWithHandler(int sequence, std::string name, EventHandler handler) -> RenderTreeFrame;
    [[nodiscard]] static auto attributeWithOpaqueValue(int sequence, std::string name, OpaqueValue value) -> RenderTreeFrame;
    [[nodiscard]] static auto childComponent(int sequence, ComponentType componentType) -> RenderTreeFrame;
    [[nodiscard]] static auto region(int sequence) -> RenderTreeFrame;

    template <ConcreteComponent T>
    [[nodiscard]] static auto childComponent(int sequence) -> RenderTreeFrame {
        return childComponent(sequence, ComponentType::of<T>());
    }

    [[nodiscard]] auto type() const noexcept -> FrameType {
        return this->type_;
    }

    [[nodiscard]] auto sequence() const noexcept -> int {
        return this->sequence_;
    }

    // 1 for Text and Attribute; 0 for a container that has not been closed yet.
    [[nodiscard]] auto subtreeLength() const noexcept -> int {
        return this->subtreeLength_;
    }

    [[nodiscard]] auto name() const noexcept -> std::string const& {
        return this->name_;
    }

    [[nodiscard]] auto textContent() const noexcept -> std::string const& {
        return this->text_;
    }

    [[nodiscard]] auto attributeValue() const noexcept -> AttributeValue const& {
        return this->value_;
    }

    [[nodiscard]] auto componentType() const noexcept -> ComponentType const& {
        return this->componentType_;
    }

    [[nodiscard]] auto withSubtreeLength(int subtreeLength) const -> Expected<RenderTreeFrame>;
    [[nodiscard]] auto withAttributeSequence(int sequence) const -> Expected<RenderTreeFrame>;

    friend auto operator==(RenderTreeFrame const& lhs, RenderTreeFrame const& rhs) -> bool;

private:
    RenderTreeFrame(FrameType type, int sequence, int subtreeLength)
        : type_(type), sequence_(sequence), subtreeLength_(subtreeLength) {}

    FrameType      type_;
    int            sequence_;
    int            subtreeLength_;
    std::string    name_;
    std::string    text_;
    AttributeValue value_;
    ComponentType  componentType_;
};

} // namespace RT
