#include <gtest/gtest.h>

#include "cst/construe.hpp"

#include <limits>

using namespace construe;

class ExprTest : public ::testing::Test {
protected:
    ContextArena arena;
    Path path{"field"};
    FrameId outer = no_frame;
    FrameId inner = no_frame;

    void SetUp() override {
        outer = arena.push(no_frame);
        arena.frame(outer).values = Container{{"count", 4}, {"name", "eth"}};
        inner = arena.push(outer);
        arena.frame(inner).values = Container{{"count", 2}, {"data", Bytes{1, 2, 3}}};
    }

    Result<Value> eval(const Expr &e, const Value *obj = nullptr) {
        return e.eval(Context(arena, inner, path), obj);
    }
};

TEST_F(ExprTest, ConstantsAndArithmetic) {
    auto v = eval(Expr(3) + 4 * 2);
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(*v == Value(11));

    auto mixed = eval(Expr(1) + 0.5);
    ASSERT_TRUE(mixed.has_value());
    EXPECT_TRUE(*mixed == Value(1.5)) << "an integer and a float give a float";

    auto mod = eval(Expr(17) % 5);
    ASSERT_TRUE(mod.has_value());
    EXPECT_TRUE(*mod == Value(2));
}

TEST_F(ExprTest, FieldLookupWalksOutward) {
    auto near = eval(this_("count"));
    ASSERT_TRUE(near.has_value());
    EXPECT_TRUE(*near == Value(2)) << "the nearest frame wins";

    auto far = eval(this_("name"));
    ASSERT_TRUE(far.has_value());
    EXPECT_TRUE(*far == Value("eth"));

    auto up = eval(parent_("count"));
    ASSERT_TRUE(up.has_value());
    EXPECT_TRUE(*up == Value(4));
}

TEST_F(ExprTest, MissingFieldIsLocated) {
    auto v = eval(this_("nope"));
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::MissingFieldError);
    EXPECT_EQ(v.error().path(), path);
}

TEST_F(ExprTest, DivisionByZero) {
    auto v = eval(this_("count") / 0);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::ArgumentError);
    EXPECT_EQ(v.error().message(), "division by zero");
}

TEST_F(ExprTest, IntegerOverflowIsArgumentError) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();

    auto add = eval(Expr(max) + 1);
    ASSERT_FALSE(add.has_value());
    EXPECT_EQ(add.error().kind(), ErrorKind::ArgumentError);
    EXPECT_EQ(add.error().path(), path);

    EXPECT_EQ(eval(Expr(min) - 1).error().kind(), ErrorKind::ArgumentError);
    EXPECT_EQ(eval(Expr(max) * 2).error().kind(), ErrorKind::ArgumentError);
    EXPECT_EQ(eval(-Expr(min)).error().kind(), ErrorKind::ArgumentError);

    auto quotient = eval(Expr(min) / -1);
    ASSERT_FALSE(quotient.has_value());
    EXPECT_EQ(quotient.error().kind(), ErrorKind::ArgumentError);

    auto remainder = eval(Expr(min) % -1);
    ASSERT_TRUE(remainder.has_value()) << remainder.error().what();
    EXPECT_TRUE(*remainder == Value(0));

    auto fits = eval(Expr(max) / -1);
    ASSERT_TRUE(fits.has_value());
    EXPECT_TRUE(*fits == Value(-max));
}

TEST(ExprParseTest, OverflowFromParsedDataIsReported) {
    auto schema = structure({
        field("a", i64be()),
        field("b", i8()),
        field("q", computed(this_("a") / this_("b"))),
    });
    auto v = schema.parse(Bytes{0x80, 0, 0, 0, 0, 0, 0, 0, 0xff});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::ArgumentError);
    EXPECT_EQ(v.error().path().str(), "q");

    auto sum = structure({field("a", i64be()), field("s", computed(this_("a") + 1))});
    auto w = sum.parse(Bytes{0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().kind(), ErrorKind::ArgumentError);
}

TEST_F(ExprTest, Comparisons) {
    auto eq = eval(this_("count") == 2);
    ASSERT_TRUE(eq.has_value());
    EXPECT_TRUE(*eq == Value(true));

    auto lt = eval(Expr("abc") < Expr("abd"));
    ASSERT_TRUE(lt.has_value());
    EXPECT_TRUE(*lt == Value(true));

    auto both = eval(this_("count") > 1 && !(this_("count") >= 3));
    ASSERT_TRUE(both.has_value());
    EXPECT_TRUE(*both == Value(true));
}

TEST_F(ExprTest, UnsupportedOperands) {
    auto v = eval(this_("name") - 1);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::ArgumentError);
    EXPECT_EQ(v.error().message(), "unsupported operands for '-': text and integer");
}

TEST_F(ExprTest, LengthAndMembers) {
    auto len = eval(len_(this_("data")));
    ASSERT_TRUE(len.has_value());
    EXPECT_TRUE(*len == Value(3));

    Value obj(Container{{"kind", 5}});
    auto member = eval(obj_()["kind"] * 2, &obj);
    ASSERT_TRUE(member.has_value());
    EXPECT_TRUE(*member == Value(10));

    auto missing = eval(obj_()["other"], &obj);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind(), ErrorKind::MissingFieldError);
}

TEST_F(ExprTest, ObjAndIndexNeedAPosition) {
    auto obj = eval(obj_());
    ASSERT_FALSE(obj.has_value());
    EXPECT_EQ(obj.error().kind(), ErrorKind::ArgumentError);

    auto idx = eval(index_());
    ASSERT_FALSE(idx.has_value());
    EXPECT_EQ(idx.error().message(), "index used outside of a repetition");

    arena.frame(outer).index = 6;
    auto found = eval(index_());
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(*found == Value(6)) << "the nearest repetition index is found through parents";
}

TEST_F(ExprTest, LambdaErrorsAreLocated) {
    Expr e = lambda_([](const Context &, const Value *) -> Result<Value> {
        return fail(ErrorKind::CheckError, {}, "rejected");
    });
    EXPECT_FALSE(e.is_static());
    auto v = eval(e);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().path(), path);
}

TEST(ExprStaticTest, StaticAndConstant) {
    EXPECT_TRUE((this_("a") + 1).is_static());
    EXPECT_FALSE((this_("a") + lambda_([](const Context &, const Value *) -> Result<Value> { return Value(1); }))
                     .is_static());

    ASSERT_NE(Expr(5).constant(), nullptr);
    EXPECT_TRUE(*Expr(5).constant() == Value(5));
    EXPECT_EQ(this_("a").constant(), nullptr);
}

TEST(ExprStaticTest, RendersAsText) {
    EXPECT_EQ((len_(this_("data")) == this_("length")).str(), "(len(this.data) == this.length)");
    EXPECT_EQ((parent_("n") * 2).str(), "(parent.n * 2)");
    EXPECT_EQ((-obj_()).str(), "-(obj)");
    EXPECT_EQ(obj_()["kind"].str(), "obj[\"kind\"]");
}
