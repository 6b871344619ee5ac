#include <gtest/gtest.h>

#include "cst/construe.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace construe;

namespace {

void expect_equivalent(const Construct &schema, const std::vector<Bytes> &samples, const CompileOptions &options = {}) {
    auto program = compile(schema, options);
    ASSERT_TRUE(program.has_value()) << program.error().what();
    for (size_t i = 0; i < samples.size(); ++i) {
        auto r = program->verify(schema, samples[i]);
        EXPECT_TRUE(r.has_value()) << "sample " << i << ": " << r.error().what();
    }
}

bool has_leaf(const CompiledProgram &program, const std::string &name) {
    const auto &leaves = program.leaf_callbacks();
    return std::find(leaves.begin(), leaves.end(), name) != leaves.end();
}

Construct record() {
    return structure({field("a", u8()), field("b", u16be()), field("c", bytes(2)), padding(1)});
}

Construct header() {
    return structure({field("length", u32be()), field("data", bytes(this_("length")))});
}

class LimitedStream final : public Stream {
public:
    explicit LimitedStream(size_t capacity) : capacity_(capacity) {
    }

    size_t read(std::span<uint8_t>) override {
        return 0;
    }
    size_t write(std::span<const uint8_t> data) override {
        size_t n = std::min(data.size(), capacity_ - data_.size());
        data_.insert(data_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
        return n;
    }

private:
    size_t capacity_;
    Bytes data_;
};

} // namespace

TEST(CompilerTest, EquivalentOnRepresentativeSchemas) {
    expect_equivalent(header(), {Bytes{0, 0, 0, 3, 'a', 'b', 'c'}, Bytes{0, 0, 0, 5, 'a'}, Bytes{}});
    expect_equivalent(record(), {Bytes{1, 0, 2, 'x', 'y', 0}, Bytes{1, 0}, Bytes{1, 0, 2, 'x'}});
    expect_equivalent(array(4, u16le()), {Bytes{1, 0, 2, 0, 3, 0, 4, 0}, Bytes{1, 0, 2, 0, 3}, Bytes{}});
    expect_equivalent(array(1, u64be()), {Bytes{0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}});
    expect_equivalent(prefixed_array(u8(), u16be()), {Bytes{2, 0, 1, 0, 2}, Bytes{3, 0, 1}, Bytes{0}});

    auto tagged = structure({
        field("kind", u8()),
        embedded_switch(this_("kind"), {
                                           {1, structure({field("a", u8())})},
                                           {2, structure({field("b", u16be()), field("c", u8())})},
                                       }),
    });
    expect_equivalent(tagged, {Bytes{1, 9}, Bytes{2, 0, 5, 6}, Bytes{3}});

    auto mixed = structure({
        field("n", u8()),
        field("name", padded_string(this_("n"))),
        field("wide", flag()),
        field("v", if_then_else(this_("wide"), u16be(), u8())),
        field("rest", greedy_range(u8())),
    });
    expect_equivalent(mixed, {Bytes{2, 'h', 'i', 1, 0, 9, 7, 7}, Bytes{2, 'h', 'i', 0, 4}, Bytes{5, 'a'}});

    auto rebuilt = structure({
        field("length", rebuild(u8(), len_(this_("data")))),
        field("data", bytes(this_("length"))),
        field("ttl", with_default(u8(), 64)),
    });
    expect_equivalent(rebuilt, {Bytes{2, 7, 8, 1}, Bytes{3, 7}});
}

TEST(CompilerTest, EquivalentWithoutFusionOrBulk) {
    CompileOptions plain;
    plain.fuse_records = false;
    plain.bulk_arrays = false;
    expect_equivalent(record(), {Bytes{1, 0, 2, 'x', 'y', 0}, Bytes{1, 0}}, plain);
    expect_equivalent(array(4, u16le()), {Bytes{1, 0, 2, 0, 3, 0, 4, 0}, Bytes{1, 0, 2, 0, 3}}, plain);
}

TEST(CompilerTest, RecordIsFullyCompiled) {
    auto program = compile(record());
    ASSERT_TRUE(program.has_value()) << program.error().what();
    EXPECT_TRUE(program->fully_compiled());
    EXPECT_TRUE(program->leaf_callbacks().empty());
    ASSERT_TRUE(program->static_size().has_value());
    EXPECT_EQ(*program->static_size(), 6u);
    EXPECT_EQ(program->size_of().value(), 6u);

    auto v = program->parse(Bytes{1, 0, 2, 'x', 'y', 0});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"a", 1}, {"b", 2}, {"c", to_bytes("xy")}}));

    auto out = program->build(*v);
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{1, 0, 2, 'x', 'y', 0}));
}

TEST(CompilerTest, RecordShortReadMatchesInterpreter) {
    auto program = compile(record());
    ASSERT_TRUE(program.has_value());
    auto v = program->parse(Bytes{1, 0});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::StreamError);
    EXPECT_EQ(v.error().path().str(), "b");
    EXPECT_EQ(v.error().message(), "expected 2 bytes, found 1");
}

TEST(CompilerTest, RecordShortWriteMatchesInterpreter) {
    auto program = compile(record());
    ASSERT_TRUE(program.has_value());
    Value input(Container{{"a", 1}, {"b", 2}, {"c", to_bytes("xy")}});

    LimitedStream interpreted_out(2);
    auto expected = record().build_stream(input, interpreted_out);
    LimitedStream compiled_out(2);
    auto actual = program->build_stream(input, compiled_out);

    ASSERT_FALSE(expected.has_value());
    ASSERT_FALSE(actual.has_value());
    EXPECT_EQ(actual.error().kind(), ErrorKind::StreamError);
    EXPECT_EQ(actual.error().path().str(), "b");
    EXPECT_EQ(actual.error().message(), "wrote 1 of 2 bytes");
    EXPECT_EQ(actual.error().message(), expected.error().message());
}

TEST(CompilerTest, BulkArrayReportsTheFailingIndex) {
    auto program = compile(array(4, u16le()));
    ASSERT_TRUE(program.has_value());
    EXPECT_TRUE(program->fully_compiled());

    auto v = program->parse(Bytes{1, 0, 2, 0, 3});
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind(), ErrorKind::StreamError);
    EXPECT_EQ(v.error().path().str(), "[2]");
    EXPECT_EQ(v.error().message(), "expected 2 bytes, found 1");
    EXPECT_TRUE(v.error().is(ErrorKind::IndexFieldError));

    auto ok = program->parse(Bytes{1, 0, 2, 0, 3, 0, 4, 0});
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(*ok == Value(List{1, 2, 3, 4}));
}

TEST(CompilerTest, DataDependentLengthUsesLeafCallback) {
    auto program = compile(header());
    ASSERT_TRUE(program.has_value());
    EXPECT_TRUE(program->fully_compiled());
    EXPECT_TRUE(has_leaf(*program, "bytes"));
    EXPECT_FALSE(program->static_size().has_value());
    EXPECT_EQ(program->size_of().error().kind(), ErrorKind::SizeofError);
    EXPECT_EQ(program->size_of(Container{{"length", 3}}).value(), 7u);

    auto out = program->build(Value(Container{{"length", 2}, {"data", Bytes{7, 8}}}));
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(*out, (Bytes{0, 0, 0, 2, 7, 8}));
}

TEST(CompilerTest, GreedyRepetitionFallsBack) {
    auto schema = structure({
        field("n", u8()),
        field("s", padded_string(this_("n"))),
        field("r", greedy_range(u8())),
    });
    auto program = compile(schema);
    ASSERT_TRUE(program.has_value());
    EXPECT_FALSE(program->fully_compiled());
    ASSERT_EQ(program->fallbacks().size(), 1u);
    EXPECT_EQ(program->fallbacks()[0].path, "r");
    EXPECT_EQ(program->fallbacks()[0].kind, "range");
    EXPECT_EQ(program->fallbacks()[0].reason, "greedy repetition");
    EXPECT_TRUE(has_leaf(*program, "padded_string"));

    auto v = program->parse(Bytes{2, 'o', 'k', 1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"n", 2}, {"s", "ok"}, {"r", List{1, 2}}}));
}

TEST(CompilerTest, AdapterPurityDecidesLowering) {
    Decoder decode = [](const Value &obj, const Context &) -> Result<Value> { return obj; };
    Encoder encode = [](const Value &obj, const Context &) -> Result<Value> { return obj; };

    auto pure = compile(adapt(u8(), decode, encode, Purity::Pure));
    ASSERT_TRUE(pure.has_value());
    EXPECT_TRUE(pure->fully_compiled());

    auto impure = compile(adapt(u8(), decode, encode));
    ASSERT_TRUE(impure.has_value());
    ASSERT_EQ(impure->fallbacks().size(), 1u);
    EXPECT_EQ(impure->fallbacks()[0].reason, "impure adapter");
    EXPECT_EQ(impure->fallbacks()[0].path, "(root)");
}

TEST(CompilerTest, LambdaFallsBack) {
    auto schema = structure({
        field("a", u8()),
        field("n", computed(lambda_([](const Context &, const Value *) -> Result<Value> { return Value(7); }))),
    });
    auto program = compile(schema);
    ASSERT_TRUE(program.has_value());
    ASSERT_EQ(program->fallbacks().size(), 1u);
    EXPECT_EQ(program->fallbacks()[0].path, "n");
    EXPECT_EQ(program->fallbacks()[0].reason, "opaque lambda");

    auto v = program->parse(Bytes{1});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"a", 1}, {"n", 7}}));
}

TEST(CompilerTest, RecursiveReferenceFallsBack) {
    Registry registry;
    ASSERT_TRUE(registry
                    .define("node", structure({
                                        field("value", u8()),
                                        field("has_next", flag()),
                                        field("next", if_then_else(this_("has_next"), registry.ref("node"), pass())),
                                    }))
                    .has_value());

    auto list = registry.ref("node");
    auto program = compile(list);
    ASSERT_TRUE(program.has_value()) << program.error().what();
    ASSERT_EQ(program->fallbacks().size(), 1u);
    EXPECT_EQ(program->fallbacks()[0].reason, "recursive reference");

    auto r = program->verify(list, Bytes{1, 1, 2, 0});
    EXPECT_TRUE(r.has_value()) << r.error().what();
}

TEST(CompilerTest, NonRecursiveReferenceIsInlined) {
    Registry registry;
    auto packet = structure({field("kind", u8()), field("body", registry.ref("body"))});
    ASSERT_TRUE(registry.define("body", structure({field("len", u8())})).has_value());

    auto program = compile(packet);
    ASSERT_TRUE(program.has_value()) << program.error().what();
    EXPECT_TRUE(program->fully_compiled());
    EXPECT_EQ(program->static_size().value(), 2u);

    auto v = program->parse(Bytes{1, 2});
    ASSERT_TRUE(v.has_value()) << v.error().what();
    EXPECT_TRUE(*v == Value(Container{{"kind", 1}, {"body", Container{{"len", 2}}}}));
}

TEST(CompilerTest, UndefinedReferenceFailsToCompile) {
    Registry registry;
    auto program = compile(structure({field("x", registry.ref("missing"))}));
    ASSERT_FALSE(program.has_value());
    EXPECT_EQ(program.error().kind(), ErrorKind::ReferenceError);
}

TEST(CompilerTest, VerifyReportsDifferences) {
    auto program = compile(u8());
    ASSERT_TRUE(program.has_value());
    auto r = program->verify(u16be(), Bytes{1, 2});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), ErrorKind::CheckError);
    EXPECT_EQ(r.error().message().rfind("compiled parse differs", 0), 0u) << r.error().message();
}

TEST(CompilerTest, VerboseLogsFallbacks) {
    CompileOptions options;
    options.verbose = true;
    testing::internal::CaptureStderr();
    auto program = compile(structure({field("r", greedy_range(u8()))}), options);
    std::string log = testing::internal::GetCapturedStderr();
    ASSERT_TRUE(program.has_value());
    EXPECT_NE(log.find("[construe] interpreting range at r: greedy repetition"), std::string::npos) << log;
    EXPECT_NE(log.find("[construe] compiled struct: 1 fallbacks"), std::string::npos) << log;
}
