#pragma once
#include <rendertree/component/ComponentType.hpp>
#include <rendertree/core/Error.hpp>
#include <rendertree/tree/ArrayBuilder.hpp>
#include <rendertree/tree/AttributeValue.hpp>
#include <rendertree/tree/BuilderOptions.hpp>
#include <rendertree/tree/RenderTreeFrame.hpp>
#include <rendertree/tree/TextForm.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RT {

/**
 * Accumulates the frames of one render pass in traversal order.
 *
 * Containers (elements, child components and regions) are opened, filled
 * and closed. Closing a container stamps its subtree length, the number of
 * frames from the container through its last descendant, so a consumer can
 * walk or skip subtrees using frame order alone.
 *
 * Attributes decorate the nearest preceding non-attribute frame, which must
 * be an element or a component.
 *
 * A builder has a single writer. Failed operations leave it unchanged.
 * Call clear() to reuse it for another pass.
 */
class RenderTreeBuilder {
public:
    RenderTreeBuilder();
    explicit RenderTreeBuilder(BuilderOptions options);

    RenderTreeBuilder(RenderTreeBuilder const&)            = delete;
    RenderTreeBuilder& operator=(RenderTreeBuilder const&) = delete;
    RenderTreeBuilder(RenderTreeBuilder&&)                 = default;
    RenderTreeBuilder& operator=(RenderTreeBuilder&&)      = default;

    auto openElement(int sequence, std::string_view elementName) -> void;
    [[nodiscard]] auto closeElement() -> Expected<void>;

    [[nodiscard]] auto openComponent(int sequence, ComponentType componentType) -> Expected<void>;
    [[nodiscard]] auto closeComponent() -> Expected<void>;

    template <ConcreteComponent T>
    [[nodiscard]] auto openComponent(int sequence) -> Expected<void> {
        return this->openComponent(sequence, ComponentType::of<T>());
    }

    auto openRegion(int sequence) -> void;
    [[nodiscard]] auto closeRegion() -> Expected<void>;

    auto addText(int sequence, std::string const& textContent) -> void;
    auto addText(int sequence, std::string_view textContent) -> void;
    // A null pointer produces empty text.
    auto addText(int sequence, char const* textContent) -> void;
    auto addText(int sequence, std::optional<std::string> const& textContent) -> void;

    template <typename T>
        requires(!Detail::StringLike<T>)
    auto addText(int sequence, T const& value) -> void {
        this->addText(sequence, Detail::textForm(value));
    }

    [[nodiscard]] auto addAttribute(int sequence, std::string_view name, std::string_view value) -> Expected<void>;
    [[nodiscard]] auto addAttribute(int sequence, std::string_view name, EventHandler value) -> Expected<void>;
    [[nodiscard]] auto addAttribute(int sequence, std::string_view name, UIEventHandler value) -> Expected<void>;

    // On an element the value is stored as its text; on a component it is
    // stored as-is.
    [[nodiscard]] auto addAttribute(int sequence, std::string_view name, OpaqueValue value) -> Expected<void>;

    template <typename T>
        requires(!Detail::StringLike<T> && !std::same_as<T, EventHandler> && !std::same_as<T, OpaqueValue>
                 && !std::convertible_to<T, UIEventHandler>)
    [[nodiscard]] auto addAttribute(int sequence, std::string_view name, T value) -> Expected<void> {
        return this->addAttribute(sequence, name, OpaqueValue::make(std::move(value)));
    }

    // Appends a copy of an existing attribute frame carrying the given sequence.
    [[nodiscard]] auto addAttribute(int sequence, RenderTreeFrame const& frame) -> Expected<void>;

    auto clear() -> void;

    // Valid until the next mutating call.
    [[nodiscard]] auto getFrames() const noexcept -> ArrayRange<RenderTreeFrame>;

    // The frames of a finished pass, or IncompleteStructure while any
    // container is still open.
    [[nodiscard]] auto finish() const -> Expected<ArrayRange<RenderTreeFrame>>;

    [[nodiscard]] auto openDepth() const noexcept -> std::size_t;
    [[nodiscard]] auto isBalanced() const noexcept -> bool;
    [[nodiscard]] auto options() const noexcept -> BuilderOptions const&;

private:
    struct OpenFrame {
        std::size_t index;
        FrameType   type;
    };

    auto openContainer(RenderTreeFrame frame) -> void;
    auto closeContainer(FrameType expected, std::string_view operation) -> Expected<void>;
    auto checkCanAddAttribute() const -> Expected<void>;
    auto append(RenderTreeFrame frame) -> void;

    BuilderOptions                options_;
    ArrayBuilder<RenderTreeFrame> entries;
    std::vector<OpenFrame>        openStack;
    std::optional<FrameType>      lastNonAttributeType;
};

} // namespace RT
