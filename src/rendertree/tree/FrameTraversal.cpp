#include <rendertree/tree/FrameTraversal.hpp>

#include <algorithm>
#include <string>

namespace RT::Traversal {

namespace {

auto spanEnd(Frames frames, std::size_t index) -> std::size_t {
    auto const length = static_cast<std::size_t>(std::max(frames[index].subtreeLength(), 1));
    return std::min(index + length, frames.count());
}

auto firstChild(Frames frames, std::size_t index) -> std::size_t {
    auto const end = spanEnd(frames, index);
    auto       i   = index + 1;
    while (i < end && frames[i].type() == FrameType::Attribute) {
        ++i;
    }
    return i;
}

auto siblingsBetween(Frames frames, std::size_t begin, std::size_t end) -> std::vector<std::size_t> {
    std::vector<std::size_t> indices;
    for (auto i = begin; i < end; i = spanEnd(frames, i)) {
        indices.push_back(i);
    }
    return indices;
}

auto at(std::size_t index) -> std::string {
    return " at index " + std::to_string(index);
}

} // namespace

auto attributesOf(Frames frames, std::size_t index) -> std::span<RenderTreeFrame const> {
    if (index >= frames.count() || !isContainer(frames[index].type())) {
        return {};
    }
    auto const begin = index + 1;
    auto const end   = firstChild(frames, index);
    return frames.span().subspan(begin, end - begin);
}

auto childIndices(Frames frames, std::size_t index) -> std::vector<std::size_t> {
    if (index >= frames.count() || !isContainer(frames[index].type())) {
        return {};
    }
    return siblingsBetween(frames, firstChild(frames, index), spanEnd(frames, index));
}

auto rootIndices(Frames frames) -> std::vector<std::size_t> {
    return siblingsBetween(frames, 0, frames.count());
}

auto validateStructure(Frames frames) -> Expected<void> {
    std::vector<std::size_t> ends{frames.count()};
    std::size_t              i = 0;
    while (i < frames.count()) {
        while (ends.size() > 1 && i >= ends.back()) {
            ends.pop_back();
        }
        auto const& frame = frames[i];
        switch (frame.type()) {
        case FrameType::Attribute:
            return std::unexpected(Error{Error::Code::IllegalAttributePosition, "attribute without an owning element or component" + at(i)});
        case FrameType::Text:
            ++i;
            continue;
        case FrameType::Element:
        case FrameType::Component:
        case FrameType::Region:
            break;
        }

        auto const length = frame.subtreeLength();
        if (length < 1 || i + static_cast<std::size_t>(length) > ends.back()) {
            return std::unexpected(Error{Error::Code::UnbalancedStructure,
                                         std::string(frameTypeName(frame.type())) + " subtree length "
                                             + std::to_string(length) + " does not fit its parent" + at(i)});
        }
        auto const end = i + static_cast<std::size_t>(length);
        auto       j   = i + 1;
        while (j < end && frames[j].type() == FrameType::Attribute) {
            if (frame.type() == FrameType::Region) {
                return std::unexpected(Error{Error::Code::IllegalAttributePosition, "attribute follows a Region" + at(j)});
            }
            ++j;
        }
        ends.push_back(end);
        i = j;
    }
    return {};
}

} // namespace RT::Traversal
