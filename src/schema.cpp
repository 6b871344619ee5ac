#include "cst/schema.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace construe {

namespace {

template <typename Kind>
Construct make(Kind kind) {
    return Construct(Node{std::move(kind)});
}

std::string list_values(const std::vector<Value> &values) {
    std::string out;
    for (const auto &v : values) {
        if (!out.empty())
            out += ", ";
        out += v.dump();
    }
    return out;
}

} // namespace

Construct bytes(Expr length) {
    return make(node::BytesField{std::move(length)});
}

Construct greedy_bytes() {
    return make(node::GreedyBytes{});
}

Construct integer(unsigned width, bool is_signed, Endian endian) {
    if (width < 1 || width > 8)
        throw std::invalid_argument(fmt::format("integer width {} is outside 1..8", width));
    return make(node::Integer{width, is_signed, endian});
}

Construct u8() {
    return integer(1, false, Endian::Big);
}
Construct u16be() {
    return integer(2, false, Endian::Big);
}
Construct u16le() {
    return integer(2, false, Endian::Little);
}
Construct u32be() {
    return integer(4, false, Endian::Big);
}
Construct u32le() {
    return integer(4, false, Endian::Little);
}
Construct u64be() {
    return integer(8, false, Endian::Big);
}
Construct u64le() {
    return integer(8, false, Endian::Little);
}
Construct i8() {
    return integer(1, true, Endian::Big);
}
Construct i16be() {
    return integer(2, true, Endian::Big);
}
Construct i16le() {
    return integer(2, true, Endian::Little);
}
Construct i32be() {
    return integer(4, true, Endian::Big);
}
Construct i32le() {
    return integer(4, true, Endian::Little);
}
Construct i64be() {
    return integer(8, true, Endian::Big);
}
Construct i64le() {
    return integer(8, true, Endian::Little);
}

Construct float32be() {
    return make(node::Float{4, Endian::Big});
}
Construct float32le() {
    return make(node::Float{4, Endian::Little});
}
Construct float64be() {
    return make(node::Float{8, Endian::Big});
}
Construct float64le() {
    return make(node::Float{8, Endian::Little});
}

Construct flag() {
    return make(node::Flag{});
}

Construct varint() {
    return make(node::VarInt{});
}

Construct padded_string(Expr length, Encoding encoding, Side pad_side, uint8_t pad, Side trim_side) {
    return make(node::PaddedString{std::move(length), encoding, pad, pad_side, trim_side});
}

Construct cstring(Encoding encoding) {
    return make(node::CString{encoding});
}

Construct greedy_string(Encoding encoding) {
    return make(node::GreedyString{encoding});
}

Construct pascal_string(Construct length, Encoding encoding) {
    return prefixed(std::move(length), greedy_string(encoding));
}

Construct computed(Expr value) {
    return make(node::Computed{std::move(value)});
}

Construct pass() {
    return make(node::Pass{});
}

Construct terminator() {
    return make(node::Terminator{});
}

Construct tell() {
    return make(node::Tell{});
}

Construct repetition_index() {
    return make(node::Index{});
}

Construct padding(Expr length, uint8_t pattern, bool strict) {
    return make(node::Padding{std::move(length), pattern, strict});
}

Construct constant(Bytes value) {
    size_t n = value.size();
    return constant(bytes(n), Value(std::move(value)));
}

Construct constant(Construct sub, Value value) {
    return make(node::Const{std::move(sub), std::move(value)});
}

Construct check(Expr predicate) {
    return make(node::Check{std::move(predicate)});
}

Construct probe(std::string label) {
    return make(node::Probe{std::move(label)});
}

Construct custom(std::shared_ptr<const LeafCodec> codec) {
    if (!codec)
        throw std::invalid_argument("custom construct needs a codec");
    return make(node::Custom{std::move(codec)});
}

Construct bitwise(Construct sub) {
    return make(node::Bitwise{std::move(sub)});
}

Construct bit_struct(std::vector<Construct> fields) {
    return bitwise(structure(std::move(fields)));
}

Construct bits_integer(unsigned bits, bool is_signed) {
    if (bits < 1 || bits > 64)
        throw std::invalid_argument(fmt::format("bit integer width {} is outside 1..64", bits));
    return make(node::BitsInteger{bits, is_signed});
}

Construct field(std::string name, Construct c) {
    if (name.empty())
        throw std::invalid_argument("field name must not be empty");
    return c.named(std::move(name));
}

Construct embedded(Construct c) {
    return c.embedded();
}

Construct structure(std::vector<Construct> fields) {
    return make(node::Struct{std::move(fields)});
}

Construct sequence(std::vector<Construct> items) {
    return make(node::Sequence{std::move(items)});
}

Construct union_of(std::vector<Construct> members, std::optional<size_t> build_from) {
    if (members.empty())
        throw std::invalid_argument("union needs at least one member");
    if (build_from && *build_from >= members.size())
        throw std::invalid_argument(
            fmt::format("union builds from member {} but has {} members", *build_from, members.size()));
    return make(node::Union{std::move(members), build_from});
}

Construct array(Expr count, Construct sub) {
    return make(node::Array{std::move(count), std::move(sub)});
}

Construct range(size_t min, size_t max, Construct sub) {
    if (min > max)
        throw std::invalid_argument(fmt::format("range minimum {} exceeds maximum {}", min, max));
    return make(node::Range{min, max, std::move(sub)});
}

Construct greedy_range(Construct sub) {
    return range(0, std::numeric_limits<size_t>::max(), std::move(sub));
}

Construct repeat_until(Expr predicate, Construct sub) {
    return make(node::RepeatUntil{std::move(predicate), std::move(sub)});
}

Construct prefixed_array(Construct count, Construct sub) {
    return make(node::PrefixedArray{std::move(count), std::move(sub)});
}

Construct switch_on(Expr key, Cases cases, std::optional<Construct> fallback) {
    return make(node::Switch{std::move(key), std::move(cases), std::move(fallback)});
}

Construct embedded_switch(Expr key, Cases cases, std::optional<Construct> fallback) {
    return switch_on(std::move(key), std::move(cases), std::move(fallback)).embedded();
}

Construct if_then_else(Expr predicate, Construct then_branch, Construct else_branch) {
    return make(node::IfThenElse{std::move(predicate), std::move(then_branch), std::move(else_branch)});
}

Construct when(Expr predicate, Construct then_branch) {
    return if_then_else(std::move(predicate), std::move(then_branch), pass());
}

Construct select(std::vector<Construct> alternatives) {
    if (alternatives.empty())
        throw std::invalid_argument("select needs at least one alternative");
    return make(node::Select{std::move(alternatives)});
}

Construct maybe(Construct sub) {
    return select({std::move(sub), pass()});
}

Construct peek(Construct sub) {
    return make(node::Peek{std::move(sub)});
}

Construct pointer(Expr offset, Construct sub) {
    return make(node::Pointer{std::move(offset), std::move(sub)});
}

Construct aligned(size_t modulus, Construct sub, uint8_t pattern) {
    if (modulus < 2)
        throw std::invalid_argument(fmt::format("alignment modulus {} must be at least 2", modulus));
    return make(node::Aligned{modulus, pattern, std::move(sub)});
}

Construct padded(Expr length, Construct sub, uint8_t pattern) {
    return make(node::Padded{std::move(length), pattern, std::move(sub)});
}

Construct on_demand(Construct sub) {
    return make(node::OnDemand{std::move(sub)});
}

Construct adapt(Construct sub, Decoder decode, Encoder encode, Purity purity) {
    return make(node::Adapter{std::move(sub), std::move(decode), std::move(encode), {}, purity});
}

Construct expr_adapter(Construct sub, Expr decode, Expr encode) {
    return make(node::ExprAdapter{std::move(sub), std::move(decode), std::move(encode)});
}

Construct validated(Construct sub, Validator validate, Purity purity) {
    if (!validate)
        throw std::invalid_argument("validated construct needs a validator");
    return make(node::Adapter{std::move(sub), {}, {}, std::move(validate), purity});
}

Construct one_of(Construct sub, std::vector<Value> allowed) {
    return validated(
        std::move(sub),
        [allowed](const Value &obj, const Context &) -> Result<void> {
            if (std::find(allowed.begin(), allowed.end(), obj) == allowed.end())
                return fail(ErrorKind::CheckError, {},
                            fmt::format("{} is not one of [{}]", obj.dump(), list_values(allowed)));
            return {};
        },
        Purity::Pure);
}

Construct none_of(Construct sub, std::vector<Value> forbidden) {
    return validated(
        std::move(sub),
        [forbidden](const Value &obj, const Context &) -> Result<void> {
            if (std::find(forbidden.begin(), forbidden.end(), obj) != forbidden.end())
                return fail(ErrorKind::CheckError, {}, fmt::format("{} is forbidden", obj.dump()));
            return {};
        },
        Purity::Pure);
}

Construct rebuild(Construct sub, Expr value) {
    return make(node::Rebuild{std::move(sub), std::move(value)});
}

Construct with_default(Construct sub, Value value) {
    return make(node::Default{std::move(sub), std::move(value)});
}

Construct transformed(Construct sub, ByteTransform decode, std::optional<size_t> decode_amount, ByteTransform encode,
                      std::optional<size_t> encode_amount) {
    if (!decode || !encode)
        throw std::invalid_argument("transformed construct needs both byte transforms");
    return make(node::Transformed{std::move(sub), std::move(decode), decode_amount, std::move(encode), encode_amount});
}

Construct restream_data(Expr data, Construct sub) {
    return make(node::RestreamData{std::move(data), std::move(sub)});
}

Construct prefixed(Construct length, Construct sub, bool include_length) {
    return make(node::Prefixed{std::move(length), std::move(sub), include_length});
}

Construct byte_swapped(Construct sub) {
    auto size = sub.size_of();
    if (!size)
        throw std::invalid_argument(fmt::format("byte swapping needs a fixed size: {}", size.error().what()));
    auto reverse = [](const Bytes &data, const Context &) -> Result<Bytes> { return Bytes(data.rbegin(), data.rend()); };
    return transformed(std::move(sub), reverse, *size, reverse, *size);
}

Construct raw_copy(Construct sub) {
    return make(node::RawCopy{std::move(sub)});
}

Construct checksum(Construct field, HashFunction hash, Expr data) {
    if (!hash)
        throw std::invalid_argument("checksum needs a hash function");
    return make(node::Checksum{std::move(field), std::move(hash), std::move(data)});
}

Construct named_tuple(std::vector<std::string> names, Construct sub) {
    if (names.empty())
        throw std::invalid_argument("named tuple needs at least one name");
    return make(node::NamedTuple{std::move(names), std::move(sub)});
}

} // namespace construe
