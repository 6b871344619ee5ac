#include <gtest/gtest.h>

#include "cst/construe.hpp"

using namespace construe;

class LinkedListTest : public ::testing::Test {
protected:
    Registry registry;

    void SetUp() override {
        auto node = structure({
            field("value", u8()),
            field("has_next", flag()),
            field("next", if_then_else(this_("has_next"), registry.ref("node"), pass())),
        });
        ASSERT_TRUE(registry.define("node", node).has_value());
    }
};

TEST_F(LinkedListTest, ParsesRecursively) {
    auto list = registry.ref("node");
    auto v = list.parse(Bytes{1, 1, 2, 1, 3, 0});
    ASSERT_TRUE(v.has_value()) << v.error().what();

    Value tail(Container{{"value", 3}, {"has_next", false}, {"next", nullptr}});
    Value middle(Container{{"value", 2}, {"has_next", true}, {"next", tail}});
    Value head(Container{{"value", 1}, {"has_next", true}, {"next", middle}});
    EXPECT_TRUE(*v == head);

    auto out = list.build(*v);
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{1, 1, 2, 1, 3, 0}));
}

TEST_F(LinkedListTest, ErrorPathFollowsRecursion) {
    auto v = registry.ref("node").parse(Bytes{1, 1, 2, 1});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::StreamError);
    EXPECT_EQ(v.error().path().str(), "next.next.value");
}

TEST_F(LinkedListTest, RegistryIntrospection) {
    EXPECT_TRUE(registry.validate().has_value());
    EXPECT_TRUE(registry.is_recursive("node"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.lookup("node").has_value());
    EXPECT_FALSE(registry.lookup("other").has_value());

    auto again = registry.define("node", u8());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind(), ErrorKind::ReferenceError);
    EXPECT_EQ(again.error().message(), "duplicate definition 'node'");
}

TEST(RegistryTest, ReferenceBeforeDefinition) {
    Registry registry;
    auto packet = structure({field("kind", u8()), field("body", registry.ref("body"))});
    ASSERT_TRUE(registry.define("body", structure({field("len", u8())})).has_value());

    auto v = packet.parse(Bytes{1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"kind", 1}, {"body", Container{{"len", 2}}}}));
    EXPECT_FALSE(registry.is_recursive("body"));
    EXPECT_EQ(packet.size_of().value(), 2u);
}

TEST(RegistryTest, MutualRecursion) {
    // An expression is either a literal or a negation of another expression.
    Registry registry;
    ASSERT_TRUE(registry
                    .define("expr", structure({
                                        field("tag", u8()),
                                        field("body", switch_on(this_("tag"), {{0, u8()}, {1, registry.ref("neg")}})),
                                    }))
                    .has_value());
    ASSERT_TRUE(registry.define("neg", structure({field("operand", registry.ref("expr"))})).has_value());
    ASSERT_TRUE(registry.validate().has_value());
    EXPECT_TRUE(registry.is_recursive("expr"));
    EXPECT_TRUE(registry.is_recursive("neg"));

    auto v = registry.ref("expr").parse(Bytes{1, 1, 0, 7});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    Value literal(Container{{"tag", 0}, {"body", 7}});
    Value inner(Container{{"tag", 1}, {"body", Container{{"operand", literal}}}});
    Value outer(Container{{"tag", 1}, {"body", Container{{"operand", inner}}}});
    EXPECT_TRUE(*v == outer);
}

TEST(RegistryTest, ValidateFindsUndefinedNames) {
    Registry registry;
    ASSERT_TRUE(registry.define("a", structure({field("x", registry.ref("missing"))})).has_value());
    auto r = registry.validate();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), ErrorKind::ReferenceError);
    EXPECT_EQ(r.error().message(), "reference to undefined name 'missing'");
    EXPECT_EQ(r.error().path().str(), "a");

    auto parsed = registry.ref("a").parse(Bytes{1});
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().kind(), ErrorKind::ReferenceError);
    EXPECT_EQ(parsed.error().message(), "undefined name 'missing'");
}

TEST(RegistryTest, ValidateFindsAliasCycles) {
    Registry registry;
    ASSERT_TRUE(registry.define("a", registry.ref("b")).has_value());
    ASSERT_TRUE(registry.define("b", registry.ref("a")).has_value());

    auto r = registry.validate();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), ErrorKind::ReferenceError);

    auto parsed = registry.ref("a").parse(Bytes{1});
    ASSERT_FALSE(parsed.has_value()) << "an alias cycle fails instead of recursing forever";
    EXPECT_EQ(parsed.error().kind(), ErrorKind::ReferenceError);
}

TEST(RegistryTest, AliasChainResolves) {
    Registry registry;
    ASSERT_TRUE(registry.define("port", registry.ref("u16")).has_value());
    ASSERT_TRUE(registry.define("u16", u16be()).has_value());
    ASSERT_TRUE(registry.validate().has_value());

    auto v = registry.ref("port").parse(Bytes{0, 80});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(80));
}

TEST(RegistryTest, RecursiveSizeIsSizeofError) {
    Registry registry;
    ASSERT_TRUE(registry.define("r", structure({field("a", u8()), field("b", registry.ref("r"))})).has_value());
    auto size = registry.ref("r").size_of();
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().kind(), ErrorKind::SizeofError);
    EXPECT_EQ(size.error().message(), "recursive reference 'r' has no static size");
}

TEST(RegistryTest, ReferenceOutlivingRegistry) {
    Construct dangling = [] {
        Registry registry;
        EXPECT_TRUE(registry.define("x", u8()).has_value());
        return registry.ref("x");
    }();

    auto v = dangling.parse(Bytes{1});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::ReferenceError);
    EXPECT_EQ(v.error().message(), "registry for 'x' no longer exists");
}

TEST(RegistryTest, CopyKeepsReferencesAlive) {
    Registry keep;
    Construct shared = [&keep] {
        Registry registry;
        EXPECT_TRUE(registry.define("x", u8()).has_value());
        keep = registry;
        return registry.ref("x");
    }();

    auto v = shared.parse(Bytes{7});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(7)) << "a copy of the registry shares its table";
}

TEST(RegistryTest, EmptyNameRejected) {
    Registry registry;
    auto r = registry.define("", u8());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), ErrorKind::ReferenceError);
}

class OnDemandTest : public ::testing::Test {
protected:
    Construct schema = structure({
        field("n", u8()),
        field("body", on_demand(array(this_("n"), u16be()))),
        field("tail", u8()),
    });

    static std::shared_ptr<const Deferred> deferred(const Value &v, const std::string &name) {
        const Value *slot = v.get<Container>()->find(name);
        if (!slot)
            return nullptr;
        const auto *lazy = slot->get<std::shared_ptr<const Deferred>>();
        return lazy ? *lazy : nullptr;
    }
};

TEST_F(OnDemandTest, ParsesOnFirstUse) {
    auto v = schema.parse(Bytes{2, 0, 7, 0, 8, 9});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v->get<Container>()->find("tail") == Value(9)) << "the body is skipped by its static size";

    auto body = deferred(*v, "body");
    ASSERT_NE(body, nullptr);
    EXPECT_FALSE(body->demanded());
    EXPECT_EQ(body->data(), (Bytes{0, 7, 0, 8}));

    auto items = body->value();
    ASSERT_TRUE(items.has_value()) << items.error().what();
    EXPECT_TRUE(*items == Value(List{7, 8})) << "the captured context still supplies the count";
    EXPECT_TRUE(body->demanded());

    auto again = demand(*v->get<Container>()->find("body"));
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(*again == Value(List{7, 8}));
    EXPECT_TRUE(*demand(Value(3)) == Value(3)) << "plain values pass through";
}

TEST_F(OnDemandTest, BuildsFromCapturedBytesOrValues) {
    Bytes wire{2, 0, 7, 0, 8, 9};
    auto v = schema.parse(wire);
    ASSERT_TRUE(v.has_value()) << v.error().what();

    auto out = schema.build(*v);
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, wire);
    EXPECT_FALSE(deferred(*v, "body")->demanded()) << "building does not force the parse";

    auto fresh = schema.build(Value(Container{{"n", 1}, {"body", List{5}}, {"tail", 6}}));
    ASSERT_TRUE(fresh.has_value()) << fresh.error().what();
    EXPECT_EQ(*fresh, (Bytes{1, 0, 5, 6}));
}

TEST_F(OnDemandTest, DumpDoesNotDemand) {
    auto v = schema.parse(Bytes{1, 0, 1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_FALSE(v->dump().empty());
    EXPECT_EQ(v->get<Container>()->find("body")->type_name(), "deferred");
    EXPECT_FALSE(deferred(*v, "body")->demanded());
}

TEST(OnDemandErrorTest, ErrorsSurfaceWhenDemanded) {
    auto schema = on_demand(one_of(u8(), {Value(1)}));
    auto v = schema.parse(Bytes{2});
    ASSERT_TRUE(v.has_value()) << "the content is not checked until it is used";

    auto demanded = demand(*v);
    ASSERT_FALSE(demanded.has_value());
    EXPECT_EQ(demanded.error().kind(), ErrorKind::CheckError);
}

TEST(OnDemandErrorTest, NeedsAKnownSize) {
    auto v = on_demand(greedy_bytes()).parse(Bytes{1, 2});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::SizeofError);
}
