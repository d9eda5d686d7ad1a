#include <doctest/doctest.h>

#include <rendertree/tree/ArrayBuilder.hpp>
#include <rendertree/tree/FrameTraversal.hpp>
#include <rendertree/tree/RenderTreeBuilder.hpp>

#include <vector>

using namespace RT;

namespace {

// <ul class="list"><li>A</li><li id="b">B</li></ul><p>tail</p>
auto buildList(RenderTreeBuilder& builder) -> void {
    builder.openElement(0, "ul");
    REQUIRE(builder.addAttribute(1, "class", "list").has_value());
    builder.openElement(2, "li");
    builder.addText(3, "A");
    REQUIRE(builder.closeElement().has_value());
    builder.openElement(2, "li");
    REQUIRE(builder.addAttribute(4, "id", "b").has_value());
    builder.addText(3, "B");
    REQUIRE(builder.closeElement().has_value());
    REQUIRE(builder.closeElement().has_value());
    builder.openElement(5, "p");
    builder.addText(6, "tail");
    REQUIRE(builder.closeElement().has_value());
}

auto closed(RenderTreeFrame frame, int length) -> RenderTreeFrame {
    auto patched = frame.withSubtreeLength(length);
    REQUIRE(patched.has_value());
    return *patched;
}

} // namespace

TEST_SUITE("tree.traversal") {
    TEST_CASE("Structure can be rebuilt from order and subtree lengths") {
        RenderTreeBuilder builder;
        buildList(builder);
        auto frames = builder.getFrames();
        REQUIRE(frames.count() == 9);

        CHECK(Traversal::rootIndices(frames) == std::vector<std::size_t>{0, 7});
        CHECK(Traversal::childIndices(frames, 0) == std::vector<std::size_t>{2, 4});
        CHECK(Traversal::childIndices(frames, 2) == std::vector<std::size_t>{3});
        CHECK(Traversal::childIndices(frames, 4) == std::vector<std::size_t>{6});
        CHECK(Traversal::childIndices(frames, 7) == std::vector<std::size_t>{8});
        CHECK(Traversal::childIndices(frames, 3).empty());

        auto ulAttributes = Traversal::attributesOf(frames, 0);
        REQUIRE(ulAttributes.size() == 1);
        CHECK(ulAttributes[0].name() == "class");
        CHECK(Traversal::attributesOf(frames, 2).empty());
        REQUIRE(Traversal::attributesOf(frames, 4).size() == 1);
        CHECK(Traversal::attributesOf(frames, 4)[0].name() == "id");

        CHECK(Traversal::validateStructure(frames).has_value());
    }

    TEST_CASE("Regions and components are walked like elements") {
        struct Leaf : Component {
            auto buildRenderTree(RenderTreeBuilder&) -> Expected<void> override {
                return {};
            }
        };

        RenderTreeBuilder builder;
        builder.openRegion(0);
        REQUIRE(builder.openComponent<Leaf>(1).has_value());
        REQUIRE(builder.addAttribute(2, "value", 7).has_value());
        REQUIRE(builder.closeComponent().has_value());
        builder.addText(3, "after");
        REQUIRE(builder.closeRegion().has_value());

        auto frames = builder.getFrames();
        CHECK(Traversal::childIndices(frames, 0) == std::vector<std::size_t>{1, 3});
        CHECK(Traversal::attributesOf(frames, 1).size() == 1);
        CHECK(Traversal::validateStructure(frames).has_value());
    }

    TEST_CASE("Empty sequence is valid") {
        ArrayRange<RenderTreeFrame> empty;
        CHECK(Traversal::rootIndices(empty).empty());
        CHECK(Traversal::validateStructure(empty).has_value());
    }

    TEST_CASE("Validation reports broken sequences") {
        ArrayBuilder<RenderTreeFrame> frames;

        SUBCASE("unclosed container") {
            frames.append(RenderTreeFrame::element(0, "div"));
            auto result = Traversal::validateStructure(frames.toRange());
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::UnbalancedStructure);
        }
        SUBCASE("span escapes its parent") {
            frames.append(closed(RenderTreeFrame::element(0, "div"), 2));
            frames.append(closed(RenderTreeFrame::element(1, "span"), 2));
            frames.append(RenderTreeFrame::text(2, "x"));
            auto result = Traversal::validateStructure(frames.toRange());
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::UnbalancedStructure);
        }
        SUBCASE("attribute at the start") {
            frames.append(RenderTreeFrame::attributeWithStringValue(0, "id", "x"));
            auto result = Traversal::validateStructure(frames.toRange());
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::IllegalAttributePosition);
        }
        SUBCASE("attribute after text") {
            frames.append(closed(RenderTreeFrame::element(0, "p"), 3));
            frames.append(RenderTreeFrame::text(1, "t"));
            frames.append(RenderTreeFrame::attributeWithStringValue(2, "id", "x"));
            auto result = Traversal::validateStructure(frames.toRange());
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::IllegalAttributePosition);
        }
        SUBCASE("attribute on a region") {
            frames.append(closed(RenderTreeFrame::region(0), 2));
            frames.append(RenderTreeFrame::attributeWithStringValue(1, "id", "x"));
            auto result = Traversal::validateStructure(frames.toRange());
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::IllegalAttributePosition);
        }
    }

    TEST_CASE("Helpers ignore indices that are not containers") {
        RenderTreeBuilder builder;
        builder.addText(0, "solo");
        auto frames = builder.getFrames();
        CHECK(Traversal::childIndices(frames, 0).empty());
        CHECK(Traversal::attributesOf(frames, 0).empty());
        CHECK(Traversal::childIndices(frames, 5).empty());
    }
}
