#include <rendertree/tree/RenderTreeBuilder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace RT {

namespace {

auto illegalAttributePosition(std::optional<FrameType> last) -> Error {
    std::string message = "Attributes may only be added immediately after frames of type "
                          + std::string(frameTypeName(FrameType::Element)) + " or "
                          + std::string(frameTypeName(FrameType::Component));
    message += last ? " (last frame is " + std::string(frameTypeName(*last)) + ")" : " (builder is empty)";
    return Error{Error::Code::IllegalAttributePosition, std::move(message)};
}

} // namespace

RenderTreeBuilder::RenderTreeBuilder()
    : RenderTreeBuilder(BuilderOptions{}) {}

RenderTreeBuilder::RenderTreeBuilder(BuilderOptions options)
    : options_(options), entries(std::min(options.initial_capacity, BuilderOptions::MAX_INITIAL_CAPACITY)) {}

auto RenderTreeBuilder::openElement(int sequence, std::string_view elementName) -> void {
    this->openContainer(RenderTreeFrame::element(sequence, std::string(elementName)));
}

auto RenderTreeBuilder::closeElement() -> Expected<void> {
    return this->closeContainer(FrameType::Element, "closeElement");
}

auto RenderTreeBuilder::openComponent(int sequence, ComponentType componentType) -> Expected<void> {
    if (!componentType.valid()) {
        rt_log("openComponent with a component type that cannot be instantiated", "RenderTreeBuilder", "ERROR");
        return std::unexpected(Error{Error::Code::InvalidComponentType, "openComponent requires an instantiable component type"});
    }
    this->openContainer(RenderTreeFrame::childComponent(sequence, std::move(componentType)));
    return {};
}

auto RenderTreeBuilder::closeComponent() -> Expected<void> {
    return this->closeContainer(FrameType::Component, "closeComponent");
}

auto RenderTreeBuilder::openRegion(int sequence) -> void {
    this->openContainer(RenderTreeFrame::region(sequence));
}

auto RenderTreeBuilder::closeRegion() -> Expected<void> {
    return this->closeContainer(FrameType::Region, "closeRegion");
}

auto RenderTreeBuilder::addText(int sequence, std::string const& textContent) -> void {
    this->append(RenderTreeFrame::text(sequence, textContent));
}

auto RenderTreeBuilder::addText(int sequence, std::string_view textContent) -> void {
    this->append(RenderTreeFrame::text(sequence, std::string(textContent)));
}

auto RenderTreeBuilder::addText(int sequence, char const* textContent) -> void {
    this->append(RenderTreeFrame::text(sequence, textContent ? std::string(textContent) : std::string{}));
}

auto RenderTreeBuilder::addText(int sequence, std::optional<std::string> const& textContent) -> void {
    this->append(RenderTreeFrame::text(sequence, textContent.value_or(std::string{})));
}

auto RenderTreeBuilder::addAttribute(int sequence, std::string_view name, std::string_view value) -> Expected<void> {
    if (auto check = this->checkCanAddAttribute(); !check) {
        return check;
    }
    this->append(RenderTreeFrame::attributeWithStringValue(sequence, std::string(name), std::string(value)));
    return {};
}

auto RenderTreeBuilder::addAttribute(int sequence, std::string_view name, EventHandler value) -> Expected<void> {
    if (auto check = this->checkCanAddAttribute(); !check) {
        return check;
    }
    this->append(RenderTreeFrame::attributeWithHandler(sequence, std::string(name), std::move(value)));
    return {};
}

auto RenderTreeBuilder::addAttribute(int sequence, std::string_view name, UIEventHandler value) -> Expected<void> {
    return this->addAttribute(sequence, name, EventHandler{std::move(value)});
}

auto RenderTreeBuilder::addAttribute(int sequence, std::string_view name, OpaqueValue value) -> Expected<void> {
    if (this->lastNonAttributeType == FrameType::Element) {
        // Element attributes can only hold strings or handlers.
        this->append(RenderTreeFrame::attributeWithStringValue(sequence, std::string(name), value.text()));
        return {};
    }
    if (this->lastNonAttributeType == FrameType::Component) {
        this->append(RenderTreeFrame::attributeWithOpaqueValue(sequence, std::string(name), std::move(value)));
        return {};
    }
    return this->checkCanAddAttribute();
}

auto RenderTreeBuilder::addAttribute(int sequence, RenderTreeFrame const& frame) -> Expected<void> {
    if (frame.type() != FrameType::Attribute) {
        rt_log("addAttribute given a " + std::string(frameTypeName(frame.type())) + " frame", "RenderTreeBuilder", "ERROR");
        return std::unexpected(Error{Error::Code::WrongFrameKind,
                                     "The frame type must be Attribute, not " + std::string(frameTypeName(frame.type()))});
    }
    if (auto check = this->checkCanAddAttribute(); !check) {
        return check;
    }
    auto restamped = frame.withAttributeSequence(sequence);
    if (!restamped) {
        return std::unexpected(restamped.error());
    }
    this->append(std::move(*restamped));
    return {};
}

auto RenderTreeBuilder::clear() -> void {
    rt_log("Clearing " + std::to_string(this->entries.count()) + " frames", "RenderTreeBuilder");
    this->entries.clear();
    this->openStack.clear();
    this->lastNonAttributeType.reset();
}

auto RenderTreeBuilder::getFrames() const noexcept -> ArrayRange<RenderTreeFrame> {
    return this->entries.toRange();
}

auto RenderTreeBuilder::finish() const -> Expected<ArrayRange<RenderTreeFrame>> {
    if (!this->openStack.empty()) {
        auto const& innermost = this->openStack.back();
        rt_log("finish with " + std::to_string(this->openStack.size()) + " open frames", "RenderTreeBuilder", "ERROR");
        return std::unexpected(Error{Error::Code::IncompleteStructure,
                                     std::to_string(this->openStack.size()) + " frame(s) still open, innermost is "
                                         + std::string(frameTypeName(innermost.type)) + " at index "
                                         + std::to_string(innermost.index)});
    }
    return this->getFrames();
}

auto RenderTreeBuilder::openDepth() const noexcept -> std::size_t {
    return this->openStack.size();
}

auto RenderTreeBuilder::isBalanced() const noexcept -> bool {
    return this->openStack.empty();
}

auto RenderTreeBuilder::options() const noexcept -> BuilderOptions const& {
    return this->options_;
}

auto RenderTreeBuilder::openContainer(RenderTreeFrame frame) -> void {
    auto const open = OpenFrame{.index = this->entries.count(), .type = frame.type()};
    // Reserved first so the push below cannot fail once the frame is in.
    if (this->openStack.size() == this->openStack.capacity()) {
        this->openStack.reserve(std::max<std::size_t>(8, this->openStack.capacity() * 2));
    }
    this->append(std::move(frame));
    this->openStack.push_back(open);
}

auto RenderTreeBuilder::closeContainer(FrameType expected, std::string_view operation) -> Expected<void> {
    if (this->openStack.empty()) {
        rt_log(std::string(operation) + " with no open frame", "RenderTreeBuilder", "ERROR");
        return std::unexpected(Error{Error::Code::UnbalancedStructure,
                                     std::string(operation) + " has no matching open " + std::string(frameTypeName(expected))});
    }

    auto const open = this->openStack.back();
    if (this->options_.close_check == CloseCheck::Strict && open.type != expected) {
        rt_log(std::string(operation) + " while a " + std::string(frameTypeName(open.type)) + " is open", "RenderTreeBuilder", "ERROR");
        return std::unexpected(Error{Error::Code::MismatchedCloseType,
                                     std::string(operation) + " expected an open " + std::string(frameTypeName(expected))
                                         + " but the innermost open frame is a " + std::string(frameTypeName(open.type))
                                         + " at index " + std::to_string(open.index)});
    }

    auto const length  = static_cast<int>(this->entries.count() - open.index);
    auto       patched = this->entries.at(open.index).withSubtreeLength(length);
    if (!patched) {
        return std::unexpected(patched.error());
    }
    this->entries.replace(open.index, std::move(*patched));
    this->openStack.pop_back();
    return {};
}

auto RenderTreeBuilder::checkCanAddAttribute() const -> Expected<void> {
    if (this->lastNonAttributeType != FrameType::Element && this->lastNonAttributeType != FrameType::Component) {
        rt_log("Attribute rejected", "RenderTreeBuilder", "ERROR");
        return std::unexpected(illegalAttributePosition(this->lastNonAttributeType));
    }
    return {};
}

auto RenderTreeBuilder::append(RenderTreeFrame frame) -> void {
    auto const type = frame.type();
    this->entries.append(std::move(frame));
    if (type != FrameType::Attribute) {
        this->lastNonAttributeType = type;
    }
}

} // namespace RT
