#pragma once
#include <rendertree/tree/TextForm.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>

namespace RT {

struct UIEventArgs {
    std::string type;
};

using UIEventHandler = std::function<void(UIEventArgs const&)>;

/**
 * Shared reference to an event callback. Copies refer to the same callback,
 * and equality is identity of that callback, so a frame keeps comparing
 * equal to itself after it has been copied out of the builder.
 */
class EventHandler {
public:
    EventHandler() = default;
    EventHandler(UIEventHandler callback)
        : callback_(callback ? std::make_shared<UIEventHandler const>(std::move(callback)) : nullptr) {}

    auto operator()(UIEventArgs const& args) const -> void {
        if (this->callback_) {
            (*this->callback_)(args);
        }
    }

    explicit operator bool() const noexcept {
        return static_cast<bool>(this->callback_);
    }

    friend auto operator==(EventHandler const& lhs, EventHandler const& rhs) -> bool {
        return lhs.callback_ == rhs.callback_;
    }

private:
    std::shared_ptr<UIEventHandler const> callback_;
};

/**
 * Type-erased property value handed to a child component. The textual form
 * is captured at construction so that the same value can also decorate an
 * element.
 */
class OpaqueValue {
public:
    OpaqueValue() = default;

    template <typename T>
    [[nodiscard]] static auto make(T value) -> OpaqueValue {
        OpaqueValue result;
        result.text_  = Detail::textForm(value);
        result.type_  = std::type_index(typeid(T));
        result.value_ = std::make_shared<T const>(std::move(value));
        return result;
    }

    // nullptr when empty or when the stored value is not a T.
    template <typename T>
    [[nodiscard]] auto get() const -> T const* {
        if (!this->value_ || !this->type_ || *this->type_ != std::type_index(typeid(T))) {
            return nullptr;
        }
        return static_cast<T const*>(this->value_.get());
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return !this->value_;
    }

    [[nodiscard]] auto text() const noexcept -> std::string const& {
        return this->text_;
    }

    [[nodiscard]] auto typeName() const -> std::string_view {
        return this->type_ ? std::string_view(this->type_->name()) : std::string_view("empty");
    }

    friend auto operator==(OpaqueValue const& lhs, OpaqueValue const& rhs) -> bool {
        return lhs.value_ == rhs.value_;
    }

private:
    std::shared_ptr<void const>    value_;
    std::optional<std::type_index> type_;
    std::string                    text_;
};

using AttributeValue = std::variant<std::string, EventHandler, OpaqueValue>;

enum class AttributeValueKind {
    String,
    Handler,
    Opaque,
};

[[nodiscard]] inline auto attributeValueKind(AttributeValue const& value) -> AttributeValueKind {
    return static_cast<AttributeValueKind>(value.index());
}

} // namespace RT
