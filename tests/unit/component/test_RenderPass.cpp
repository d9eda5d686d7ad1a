#include <doctest/doctest.h>

#include <rendertree/component/RenderPass.hpp>
#include <rendertree/tree/FrameTraversal.hpp>

#include <string>
#include <vector>

using namespace RT;

namespace {

class TodoList : public Component {
public:
    std::vector<std::string> items{"write", "test"};

    auto buildRenderTree(RenderTreeBuilder& builder) -> Expected<void> override {
        builder.openElement(0, "ul");
        if (auto r = builder.addAttribute(1, "class", "todo"); !r) {
            return r;
        }
        for (auto const& item : items) {
            builder.openRegion(2);
            builder.openElement(3, "li");
            builder.addText(4, item);
            if (auto r = builder.closeElement(); !r) {
                return r;
            }
            if (auto r = builder.closeRegion(); !r) {
                return r;
            }
        }
        return builder.closeElement();
    }
};

class Unclosed : public Component {
public:
    auto buildRenderTree(RenderTreeBuilder& builder) -> Expected<void> override {
        builder.openElement(0, "div");
        return {};
    }
};

class Misplaced : public Component {
public:
    auto buildRenderTree(RenderTreeBuilder& builder) -> Expected<void> override {
        builder.addText(0, "t");
        return builder.addAttribute(1, "id", "x");
    }
};

} // namespace

TEST_SUITE("component.render_pass") {
    TEST_CASE("A component renders into the builder it is given") {
        TodoList          list;
        RenderTreeBuilder builder;

        auto frames = renderComponent(list, builder);
        REQUIRE(frames.has_value());
        REQUIRE(frames->count() == 8);
        CHECK((*frames)[0].subtreeLength() == 8);
        CHECK((*frames)[2].type() == FrameType::Region);
        CHECK((*frames)[2].subtreeLength() == 3);
        CHECK((*frames)[4].textContent() == "write");
        CHECK(Traversal::validateStructure(*frames).has_value());
    }

    TEST_CASE("A builder is reused across passes") {
        TodoList          list;
        RenderTreeBuilder builder;
        REQUIRE(renderComponent(list, builder).has_value());

        list.items = {"only"};
        auto second = renderComponent(list, builder);
        REQUIRE(second.has_value());
        CHECK(second->count() == 5);
        CHECK((*second)[4].textContent() == "only");
    }

    TEST_CASE("Independent builders do not share state") {
        TodoList          list;
        RenderTreeBuilder first;
        RenderTreeBuilder second;
        REQUIRE(renderComponent(list, first).has_value());
        second.addText(0, "other");
        CHECK(first.getFrames().count() == 8);
        CHECK(second.getFrames().count() == 1);
    }

    TEST_CASE("Failures end the pass") {
        RenderTreeBuilder builder;

        SUBCASE("unclosed element") {
            Unclosed component;
            auto     result = renderComponent(component, builder);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::IncompleteStructure);
        }
        SUBCASE("contract violation from the component") {
            Misplaced component;
            auto      result = renderComponent(component, builder);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::IllegalAttributePosition);
        }
    }
}
