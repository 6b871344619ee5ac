#include <gtest/gtest.h>

#include "cst/construe.hpp"

using namespace construe;

TEST(PeekTest, ReadsWithoutConsuming) {
    auto schema = structure({field("p", peek(u16be())), field("a", u8()), field("b", u8())});
    auto v = schema.parse(Bytes{1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"p", 258}, {"a", 1}, {"b", 2}}));

    auto out = schema.build(Value(Container{{"a", 1}, {"b", 2}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{1, 2})) << "peek writes nothing";
    EXPECT_EQ(schema.size_of().value(), 2u);
}

TEST(PeekTest, ShortInputGivesNone) {
    auto schema = sequence({peek(u32be()), u8()});
    auto v = schema.parse(Bytes{7});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(List{nullptr, 7}));
}

TEST(PointerTest, JumpsAndReturns) {
    auto schema = structure({
        field("off", u8()),
        field("v", pointer(this_("off"), u8())),
        field("next", u8()),
    });
    auto v = schema.parse(Bytes{3, 0, 0, 42});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"off", 3}, {"v", 42}, {"next", 0}}));

    auto out = schema.build(*v);
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{3, 0, 0, 42}));
}

TEST(PointerTest, NeedsSeekableStream) {
    auto schema = structure({field("v", pointer(2, u8()))});
    BufferStream inner(Bytes{0, 0, 5});
    ForwardStream fwd(inner);
    auto v = schema.parse_stream(fwd);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::StreamError);
    EXPECT_EQ(v.error().path().str(), "v");
    EXPECT_EQ(v.error().message(), "stream is not seekable");
}

TEST(AlignedTest, PadsToModulus) {
    auto schema = structure({field("a", aligned(4, u8())), field("b", u8())});
    auto v = schema.parse(Bytes{1, 0, 0, 0, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"a", 1}, {"b", 2}}));

    auto out = schema.build(*v);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (Bytes{1, 0, 0, 0, 2}));
    EXPECT_EQ(schema.size_of().value(), 5u);
    EXPECT_EQ(aligned(4, u32be()).size_of().value(), 4u) << "aligned content gets no extra padding";
}

TEST(PaddedTest, FixedFootprint) {
    auto schema = sequence({padded(4, cstring()), u8()});
    auto v = schema.parse(Bytes{'h', 'i', 0, 0xee, 9});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(List{"hi", 9}));

    auto out = schema.build(*v);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (Bytes{'h', 'i', 0, 0, 9}));

    auto overflow = padded(2, cstring()).build(Value("long"));
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error().kind(), ErrorKind::FormatFieldError);
    EXPECT_EQ(overflow.error().message(), "content used 5 bytes, more than the padded length 2");
}

TEST(TransformedTest, ByteSwapped) {
    auto schema = byte_swapped(u32be());
    auto v = schema.parse(Bytes{1, 0, 0, 0});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(1));

    auto out = schema.build(Value(1));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (Bytes{1, 0, 0, 0}));
    EXPECT_EQ(schema.size_of().value(), 4u);
}

TEST(TransformedTest, ObfuscatedTail) {
    ByteTransform flip = [](const Bytes &data, const Context &) -> Result<Bytes> {
        Bytes out = data;
        for (auto &b : out) {
            b ^= 0x5a;
        }
        return out;
    };
    auto schema = structure({field("n", u8()), field("body", transformed(greedy_string(), flip, std::nullopt, flip,
                                                                         std::nullopt))});
    Bytes wire{1, 'o' ^ 0x5a, 'k' ^ 0x5a};
    auto v = schema.parse(wire);
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"n", 1}, {"body", "ok"}}));

    auto out = schema.build(*v);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, wire);
    EXPECT_EQ(schema.size_of().error().kind(), ErrorKind::SizeofError);
}

TEST(RestreamTest, ParsesBytesAlreadyRead) {
    auto schema = structure({field("blob", bytes(2)), field("v", restream_data(this_("blob"), u16le()))});
    auto v = schema.parse(Bytes{1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"blob", Bytes{1, 2}}, {"v", 513}}));

    auto out = schema.build(Value(Container{{"blob", Bytes{1, 2}}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{1, 2})) << "the restreamed view writes nothing of its own";
}

TEST(PrefixedTest, LengthBoundsTheWindow) {
    auto schema = sequence({prefixed(u8(), greedy_string()), greedy_bytes()});
    auto v = schema.parse(Bytes{3, 'a', 'b', 'c', 'x'});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(List{"abc", Bytes{'x'}}));

    auto out = prefixed(u16be(), greedy_bytes()).build(Value(Bytes{7, 8}));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (Bytes{0, 2, 7, 8}));
}

TEST(PrefixedTest, IncludeLength) {
    auto schema = prefixed(u8(), greedy_bytes(), true);
    auto v = schema.parse(Bytes{3, 'a', 'b', 'c'});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(to_bytes("ab"))) << "the prefix counts its own byte";

    auto out = schema.build(Value(to_bytes("ab")));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, (Bytes{3, 'a', 'b'}));

    auto bad = schema.parse(Bytes{0});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind(), ErrorKind::ArgumentError);
}

TEST(PrefixedTest, ShortWindowIsStreamError) {
    auto v = prefixed(u8(), greedy_bytes()).parse(Bytes{5, 1, 2});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::StreamError);
    EXPECT_EQ(v.error().message(), "expected 5 bytes, found 2");
}

TEST(RawCopyTest, RecordsBytesAndOffsets) {
    auto schema = structure({field("pre", u8()), field("rc", raw_copy(u16be()))});
    auto v = schema.parse(Bytes{9, 1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    Value expected(Container{
        {"pre", 9},
        {"rc", Container{{"data", Bytes{1, 2}}, {"value", 258}, {"offset1", 1}, {"offset2", 3}, {"length", 2}}},
    });
    EXPECT_TRUE(*v == expected);
}

TEST(RawCopyTest, BuildFromDataOrValue) {
    auto schema = raw_copy(u16be());
    auto from_data = schema.build(Value(Container{{"data", Bytes{1, 2}}}));
    ASSERT_TRUE(from_data.has_value()) << from_data.error().what();
    EXPECT_EQ(*from_data, (Bytes{1, 2}));

    auto from_value = schema.build(Value(Container{{"value", 258}}));
    ASSERT_TRUE(from_value.has_value()) << from_value.error().what();
    EXPECT_EQ(*from_value, (Bytes{1, 2}));

    auto neither = schema.build(Value(Container{}));
    ASSERT_FALSE(neither.has_value());
    EXPECT_EQ(neither.error().kind(), ErrorKind::MissingFieldError);
}

TEST(RawCopyTest, FailuresAreWrapped) {
    auto v = structure({field("pre", u8()), field("rc", raw_copy(u16be()))}).parse(Bytes{9, 1});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::StreamError);
    EXPECT_TRUE(v.error().is(ErrorKind::RawCopyError));
}

namespace {

Result<Value> sum8(const Bytes &data) {
    int64_t sum = 0;
    for (uint8_t b : data) {
        sum += b;
    }
    return Value(sum & 0xff);
}

Construct checksummed() {
    return structure({field("body", bytes(3)), field("sum", checksum(u8(), sum8, this_("body")))});
}

} // namespace

TEST(ChecksumTest, VerifiesOnParse) {
    auto v = checksummed().parse(Bytes{1, 2, 3, 6});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"body", Bytes{1, 2, 3}}, {"sum", 6}}));

    auto bad = checksummed().parse(Bytes{1, 2, 3, 7});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind(), ErrorKind::CheckError);
    EXPECT_EQ(bad.error().path().str(), "sum");
    EXPECT_EQ(bad.error().message(), "checksum mismatch: stored 7, computed 6");
}

TEST(ChecksumTest, ComputedOnBuild) {
    auto out = checksummed().build(Value(Container{{"body", Bytes{1, 2, 3}}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{1, 2, 3, 6}));
}

TEST(NamedTupleTest, NamesSequenceItems) {
    auto schema = named_tuple({"x", "y"}, sequence({u8(), u8()}));
    auto v = schema.parse(Bytes{1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"x", 1}, {"y", 2}}));

    auto out = schema.build(Value(Container{{"y", 2}, {"x", 1}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{1, 2}));

    auto as_list = schema.build(Value(List{3, 4}));
    ASSERT_TRUE(as_list.has_value());
    EXPECT_EQ(*as_list, (Bytes{3, 4}));
}

TEST(NamedTupleTest, CountMismatch) {
    auto v = named_tuple({"x"}, sequence({u8(), u8()})).parse(Bytes{1, 2});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::NamedTupleError);
    EXPECT_EQ(v.error().message(), "1 names for 2 values");

    auto out = named_tuple({"x", "y"}, sequence({u8(), u8()})).build(Value(5));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().kind(), ErrorKind::NamedTupleError);
}
