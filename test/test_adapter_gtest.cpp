#include <gtest/gtest.h>

#include "cst/construe.hpp"

using namespace construe;

TEST(RebuildTest, LengthFollowsPayload) {
    auto header = structure({
        field("length", rebuild(u32be(), len_(this_("data")))),
        field("data", bytes(this_("length"))),
    });

    auto out = header.build(Value(Container{{"length", 3}, {"data", to_bytes("HELLO")}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{0, 0, 0, 5, 'H', 'E', 'L', 'L', 'O'})) << "a stale length is recomputed";

    auto v = header.parse(*out);
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(*v == Value(Container{{"length", 5}, {"data", to_bytes("HELLO")}}));
}

TEST(CheckTest, InconsistentLengthIsCheckError) {
    auto header = structure({
        field("length", u32be()),
        field("data", greedy_bytes()),
        check(len_(this_("data")) == this_("length")),
    });

    auto ok = header.build(Value(Container{{"length", 3}, {"data", to_bytes("ABC")}}));
    ASSERT_TRUE(ok.has_value()) << ok.error().what();

    auto bad = header.build(Value(Container{{"length", 3}, {"data", to_bytes("HELLO")}}));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind(), ErrorKind::CheckError);
    EXPECT_EQ(bad.error().message(), "check failed: (len(this.data) == this.length)");

    auto parsed = header.parse(Bytes{0, 0, 0, 2, 'A', 'B', 'C'});
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().kind(), ErrorKind::CheckError);
}

TEST(CheckTest, InconsistentCountIsRepeatError) {
    auto header = structure({field("length", u8()), field("data", array(this_("length"), u8()))});
    auto out = header.build(Value(Container{{"length", 3}, {"data", List{1, 2, 3, 4, 5}}}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().kind(), ErrorKind::RepeatError);
}

TEST(ExprAdapterTest, ScalesBothWays) {
    auto schema = expr_adapter(u8(), obj_() * 2, obj_() / 2);
    auto v = schema.parse(Bytes{5});
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(*v == Value(10));

    auto out = schema.build(Value(10));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (Bytes{5}));
    EXPECT_EQ(schema.size_of().value(), 1u);
}

namespace {

Construct link_state() {
    Decoder decode = [](const Value &obj, const Context &) -> Result<Value> {
        const auto *n = obj.get<int64_t>();
        if (n && *n == 0)
            return Value("down");
        if (n && *n == 1)
            return Value("up");
        return fail(ErrorKind::FormatFieldError, {}, "unknown link state " + obj.dump());
    };
    Encoder encode = [](const Value &obj, const Context &) -> Result<Value> {
        if (obj == Value("down"))
            return Value(0);
        if (obj == Value("up"))
            return Value(1);
        return fail(ErrorKind::FormatFieldError, {}, "unknown link state " + obj.dump());
    };
    return adapt(u8(), decode, encode, Purity::Pure);
}

} // namespace

TEST(AdapterTest, MapsValues) {
    auto schema = structure({field("link", link_state())});
    auto v = schema.parse(Bytes{1});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"link", "up"}}));

    auto out = schema.build(Value(Container{{"link", "down"}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{0}));
}

TEST(AdapterTest, CallbackErrorsAreLocated) {
    auto schema = structure({field("link", link_state())});
    auto v = schema.parse(Bytes{7});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::FormatFieldError);
    EXPECT_EQ(v.error().path().str(), "link");

    auto out = schema.build(Value(Container{{"link", "sideways"}}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().path().str(), "link");
}

TEST(AdapterTest, CallbacksSeeContext) {
    Decoder decode = [](const Value &obj, const Context &ctx) -> Result<Value> {
        auto scale = ctx.get("scale");
        if (!scale)
            return std::unexpected(scale.error());
        return Value(*obj.get<int64_t>() * *scale->get<int64_t>());
    };
    Encoder encode = [](const Value &obj, const Context &ctx) -> Result<Value> {
        auto scale = ctx.get("scale");
        if (!scale)
            return std::unexpected(scale.error());
        return Value(*obj.get<int64_t>() / *scale->get<int64_t>());
    };
    auto schema = structure({field("scale", u8()), field("v", adapt(u8(), decode, encode))});

    auto v = schema.parse(Bytes{10, 3});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"scale", 10}, {"v", 30}}));

    auto out = schema.build(*v);
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{10, 3}));
}

TEST(ValidatorTest, OneOf) {
    auto schema = structure({field("version", one_of(u8(), {1, 2}))});
    EXPECT_TRUE(schema.parse(Bytes{2}).has_value());

    auto v = schema.parse(Bytes{3});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::CheckError);
    EXPECT_EQ(v.error().path().str(), "version");
    EXPECT_EQ(v.error().message(), "3 is not one of [1, 2]");

    auto out = schema.build(Value(Container{{"version", 9}}));
    ASSERT_FALSE(out.has_value()) << "values are validated before they are built";
    EXPECT_EQ(out.error().kind(), ErrorKind::CheckError);
}

TEST(ValidatorTest, NoneOf) {
    auto schema = none_of(u8(), {0});
    EXPECT_TRUE(schema.parse(Bytes{1}).has_value());

    auto v = schema.parse(Bytes{0});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::CheckError);
    EXPECT_EQ(v.error().message(), "0 is forbidden");
}

TEST(ValidatorTest, CustomValidator) {
    Validator even = [](const Value &obj, const Context &) -> Result<void> {
        if (*obj.get<int64_t>() % 2 != 0)
            return fail(ErrorKind::CheckError, {}, "odd value");
        return {};
    };
    auto schema = validated(u8(), even, Purity::Pure);
    EXPECT_TRUE(schema.parse(Bytes{4}).has_value());
    EXPECT_FALSE(schema.parse(Bytes{5}).has_value());
    EXPECT_FALSE(schema.build(Value(5)).has_value());
}

TEST(DefaultTest, UsedOnlyWhenAbsent) {
    auto schema = structure({field("ttl", with_default(u8(), 64))});
    auto absent = schema.build(Value(Container{}));
    ASSERT_TRUE(absent.has_value()) << absent.error().what();
    EXPECT_EQ(*absent, (Bytes{64}));

    auto given = schema.build(Value(Container{{"ttl", 1}}));
    ASSERT_TRUE(given.has_value());
    EXPECT_EQ(*given, (Bytes{1}));

    auto v = schema.parse(Bytes{9});
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(*v == Value(Container{{"ttl", 9}}));
}

TEST(DefaultTest, DefaultIsVisibleToLaterFields) {
    auto schema = structure({
        field("n", with_default(u8(), 2)),
        field("items", array(this_("n"), u8())),
    });
    auto out = schema.build(Value(Container{{"items", List{4, 5}}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{2, 4, 5}));
}
