#include <doctest/doctest.h>

#include <rendertree/component/ComponentType.hpp>
#include <rendertree/tree/RenderTreeBuilder.hpp>

using namespace RT;

namespace {

class Greeting : public Component {
public:
    auto buildRenderTree(RenderTreeBuilder& builder) -> Expected<void> override {
        builder.addText(0, "hello");
        return {};
    }
};

class Farewell : public Component {
public:
    auto buildRenderTree(RenderTreeBuilder& builder) -> Expected<void> override {
        builder.addText(0, "bye");
        return {};
    }
};

class Abstract : public Component {};

class NeedsArgument : public Component {
public:
    explicit NeedsArgument(int) {}
    auto buildRenderTree(RenderTreeBuilder&) -> Expected<void> override {
        return {};
    }
};

static_assert(ConcreteComponent<Greeting>);
static_assert(!ConcreteComponent<Abstract>);
static_assert(!ConcreteComponent<NeedsArgument>);
static_assert(!ConcreteComponent<int>);

} // namespace

TEST_SUITE("component.type") {
    TEST_CASE("Typed identifiers instantiate their component") {
        auto type = ComponentType::of<Greeting>("Greeting");
        CHECK(type.valid());
        CHECK(type.name() == "Greeting");
        CHECK(type.is<Greeting>());
        CHECK_FALSE(type.is<Farewell>());

        auto instance = type.instantiate();
        REQUIRE(instance.has_value());
        REQUIRE(*instance != nullptr);

        RenderTreeBuilder builder;
        REQUIRE((*instance)->buildRenderTree(builder).has_value());
        CHECK(builder.getFrames()[0].textContent() == "hello");
    }

    TEST_CASE("Each instantiation is a new component") {
        auto type  = ComponentType::of<Greeting>();
        auto first = type.instantiate();
        auto other = type.instantiate();
        REQUIRE(first.has_value());
        REQUIRE(other.has_value());
        CHECK(first->get() != other->get());
        CHECK_FALSE(type.name().empty());
    }

    TEST_CASE("Equality follows the component type") {
        CHECK(ComponentType::of<Greeting>("a") == ComponentType::of<Greeting>("b"));
        CHECK_FALSE(ComponentType::of<Greeting>() == ComponentType::of<Farewell>());
        CHECK(ComponentType{} == ComponentType{});
    }

    TEST_CASE("Default identifier cannot be instantiated") {
        ComponentType type;
        CHECK_FALSE(type.valid());
        CHECK_FALSE(type.typeIndex().has_value());
        auto instance = type.instantiate();
        REQUIRE_FALSE(instance.has_value());
        CHECK(instance.error().code == Error::Code::InvalidComponentType);
    }
}
