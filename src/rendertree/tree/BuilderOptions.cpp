#include <rendertree/tree/BuilderOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    auto text = trim(value);
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto parse_capacity(char const* value) -> std::optional<std::size_t> {
    if (value == nullptr) {
        return std::nullopt;
    }
    auto        text   = trim(value);
    std::size_t parsed = 0;
    auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || parsed == 0
        || parsed > RT::BuilderOptions::MAX_INITIAL_CAPACITY) {
        rt_log("Ignoring RENDERTREE_INITIAL_CAPACITY=" + std::string(text), "BuilderOptions", "WARNING");
        return std::nullopt;
    }
    return parsed;
}

} // namespace

namespace RT {

auto BuilderOptions::fromEnvironment() -> BuilderOptions {
    BuilderOptions options;
    if (auto capacity = parse_capacity(std::getenv("RENDERTREE_INITIAL_CAPACITY"))) {
        options.initial_capacity = *capacity;
    }
    if (parse_truthy(std::getenv("RENDERTREE_PERMISSIVE_CLOSE"))) {
        options.close_check = CloseCheck::Permissive;
    }
    return options;
}

auto closeCheckName(CloseCheck check) -> std::string_view {
    switch (check) {
    case CloseCheck::Strict:
        return "strict";
    case CloseCheck::Permissive:
        return "permissive";
    }
    return "unknown";
}

} // namespace RT
