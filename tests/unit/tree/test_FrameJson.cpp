#include <doctest/doctest.h>

#include <rendertree/tree/FrameJson.hpp>
#include <rendertree/tree/RenderTreeBuilder.hpp>

#include <nlohmann/json.hpp>

using namespace RT;

namespace {

class Avatar : public Component {
public:
    auto buildRenderTree(RenderTreeBuilder&) -> Expected<void> override {
        return {};
    }
};

} // namespace

TEST_SUITE("tree.json") {
    TEST_CASE("Frames serialize with their payload") {
        RenderTreeBuilder builder;
        builder.openElement(0, "ul");
        builder.openElement(1, "li");
        REQUIRE(builder.addAttribute(2, "class", "item").has_value());
        REQUIRE(builder.addAttribute(3, "onclick", EventHandler{[](UIEventArgs const&) {}}).has_value());
        builder.addText(4, "A");
        REQUIRE(builder.closeElement().has_value());
        REQUIRE(builder.closeElement().has_value());

        auto json = Json::framesToJson(builder.getFrames());
        REQUIRE(json.is_array());
        REQUIRE(json.size() == 5);

        CHECK(json[0]["type"] == "Element");
        CHECK(json[0]["name"] == "ul");
        CHECK(json[0]["subtree_length"] == 5);
        CHECK(json[1]["subtree_length"] == 4);
        CHECK(json[2]["type"] == "Attribute");
        CHECK(json[2]["name"] == "class");
        CHECK(json[2]["value"] == "item");
        CHECK(json[3]["value"] == "<handler>");
        CHECK(json[4]["type"] == "Text");
        CHECK(json[4]["text"] == "A");
        CHECK(json[4]["sequence"] == 4);
        CHECK_FALSE(json[4].contains("subtree_length"));
    }

    TEST_CASE("Regions and components") {
        RenderTreeBuilder builder;
        builder.openRegion(0);
        REQUIRE(builder.openComponent(1, ComponentType::of<Avatar>("Avatar")).has_value());
        REQUIRE(builder.addAttribute(2, "size", 48).has_value());
        REQUIRE(builder.closeComponent().has_value());
        REQUIRE(builder.closeRegion().has_value());

        auto json = Json::framesToJson(builder.getFrames());
        REQUIRE(json.size() == 3);
        CHECK(json[0]["type"] == "Region");
        CHECK(json[0]["subtree_length"] == 3);
        CHECK_FALSE(json[0].contains("name"));
        CHECK(json[1]["component"] == "Avatar");
        CHECK(json[2]["value"].contains("opaque"));
    }

    TEST_CASE("Empty sequence serializes to an empty array") {
        RenderTreeBuilder builder;
        auto              json = Json::framesToJson(builder.getFrames());
        CHECK(json.is_array());
        CHECK(json.empty());
    }
}
