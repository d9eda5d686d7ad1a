#pragma once
#include <rendertree/core/Error.hpp>
#include <rendertree/tree/ArrayRange.hpp>
#include <rendertree/tree/RenderTreeFrame.hpp>

#include <cstddef>
#include <span>
#include <vector>

// Read-side helpers for consumers that walk a finished frame sequence using
// frame order and subtree lengths only.
namespace RT::Traversal {

using Frames = ArrayRange<RenderTreeFrame>;

// Attribute frames directly following the container at index.
[[nodiscard]] auto attributesOf(Frames frames, std::size_t index) -> std::span<RenderTreeFrame const>;

// Indices of the direct children of the container at index, in order.
[[nodiscard]] auto childIndices(Frames frames, std::size_t index) -> std::vector<std::size_t>;

// Indices of the top-level frames.
[[nodiscard]] auto rootIndices(Frames frames) -> std::vector<std::size_t>;

/**
 * Checks what a builder guarantees for a finished pass: every container
 * span has length >= 1 and nests inside its parent, and attributes only
 * follow an element or a component (possibly after other attributes).
 * Reports the first violation found.
 */
[[nodiscard]] auto validateStructure(Frames frames) -> Expected<void>;

} // namespace RT::Traversal
