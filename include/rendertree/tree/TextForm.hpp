#pragma once
#include <concepts>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace RT::Detail {

template <typename T>
concept Streamable = requires(std::ostream& os, T const& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

// Types that already have a dedicated text overload on the builder.
template <typename T>
concept StringLike = std::convertible_to<T const&, std::string_view>
                     || std::is_null_pointer_v<std::remove_cvref_t<T>>
                     || std::same_as<std::remove_cvref_t<T>, std::optional<std::string>>;

// Textual form of an arbitrary value. Types without a stream operator fall
// back to their implementation-defined type name.
template <typename T>
auto textForm(T const& value) -> std::string {
    if constexpr (std::convertible_to<T const&, std::string_view>) {
        return std::string(std::string_view(value));
    } else if constexpr (std::same_as<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (Streamable<T>) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return typeid(T).name();
    }
}

} // namespace RT::Detail
