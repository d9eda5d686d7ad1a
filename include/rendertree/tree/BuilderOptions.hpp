#pragma once

#include <cstddef>
#include <string_view>

namespace RT {

enum class CloseCheck {
    // Close* must match the kind of the innermost open frame.
    Strict,
    // Close* pops whatever container is innermost, whatever its kind.
    Permissive,
};

struct BuilderOptions {
    // Upper bound on the frames reserved up front; the buffer still grows
    // past it on demand.
    static constexpr std::size_t MAX_INITIAL_CAPACITY = std::size_t{1} << 20;

    std::size_t initial_capacity = 10;
    CloseCheck  close_check      = CloseCheck::Strict;

    // Defaults overridden by RENDERTREE_INITIAL_CAPACITY (integer in
    // 1..MAX_INITIAL_CAPACITY)
    // and RENDERTREE_PERMISSIVE_CLOSE (truthy unless 0/false/off/no).
    [[nodiscard]] static auto fromEnvironment() -> BuilderOptions;
};

[[nodiscard]] auto closeCheckName(CloseCheck check) -> std::string_view;

} // namespace RT
