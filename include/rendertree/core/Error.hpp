#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace RT {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        UnbalancedStructure,
        MismatchedCloseType,
        IllegalAttributePosition,
        WrongFrameKind,
        InvalidComponentType,
        NotFound,
        IncompleteStructure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::UnbalancedStructure:
        return "unbalanced_structure";
    case Error::Code::MismatchedCloseType:
        return "mismatched_close_type";
    case Error::Code::IllegalAttributePosition:
        return "illegal_attribute_position";
    case Error::Code::WrongFrameKind:
        return "wrong_frame_kind";
    case Error::Code::InvalidComponentType:
        return "invalid_component_type";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::IncompleteStructure:
        return "incomplete_structure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace RT
