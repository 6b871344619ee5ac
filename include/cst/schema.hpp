#pragma once

#include "cst/construct.hpp"
#include "cst/expr.hpp"
#include "cst/node.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * Schema assembly. Every factory returns an immutable Construct; misuse that
 * can be detected while assembling (bad widths, empty names, min > max...)
 * throws std::invalid_argument.
 */
namespace construe {

// leaves

Construct bytes(Expr length);
Construct greedy_bytes();

/** @brief Fixed width integer, 1 to 8 bytes. */
Construct integer(unsigned width, bool is_signed, Endian endian);
Construct u8();
Construct u16be();
Construct u16le();
Construct u32be();
Construct u32le();
Construct u64be();
Construct u64le();
Construct i8();
Construct i16be();
Construct i16le();
Construct i32be();
Construct i32le();
Construct i64be();
Construct i64le();

Construct float32be();
Construct float32le();
Construct float64be();
Construct float64le();

Construct flag();
/** @brief Unsigned LEB128. */
Construct varint();

/**
 * @brief String stored in exactly @p length bytes.
 *
 * Building pads short text with @p pad on @p pad_side and cuts overlong text
 * from @p trim_side. Parsing strips @p pad from @p pad_side only.
 */
Construct padded_string(Expr length, Encoding encoding = Encoding::Utf8, Side pad_side = Side::Right,
                        uint8_t pad = 0, Side trim_side = Side::Right);
Construct cstring(Encoding encoding = Encoding::Utf8);
Construct greedy_string(Encoding encoding = Encoding::Utf8);
/** @brief String preceded by its byte length, stored as @p length. */
Construct pascal_string(Construct length, Encoding encoding = Encoding::Utf8);

Construct computed(Expr value);
Construct pass();
Construct terminator();
Construct tell();
Construct repetition_index();
Construct padding(Expr length, uint8_t pattern = 0, bool strict = false);
Construct constant(Bytes value);
Construct constant(Construct sub, Value value);
Construct check(Expr predicate);
Construct probe(std::string label = {});
Construct custom(std::shared_ptr<const LeafCodec> codec);

// bits

/**
 * @brief Runs @p sub over the bits of the stream instead of its bytes.
 *
 * Each bit is presented to @p sub as one byte holding 0 or 1, most significant
 * bit first, so `bits_integer`, `flag` and `padding` count bits inside it. The
 * content must cover a whole number of bytes.
 */
Construct bitwise(Construct sub);
/** @brief Struct laid out in bits: `bitwise(structure(fields))`. */
Construct bit_struct(std::vector<Construct> fields);
/** @brief Big-endian integer of @p bits bits, one byte per bit. Use inside `bitwise`. */
Construct bits_integer(unsigned bits, bool is_signed = false);

// structure

Construct field(std::string name, Construct c);
Construct embedded(Construct c);
Construct structure(std::vector<Construct> fields);
Construct sequence(std::vector<Construct> items);
/**
 * @brief Members that all parse from the same position, like a C union.
 *
 * Parsing leaves the stream after the widest member. Building writes the
 * member at @p build_from, or else the first member whose key is present and
 * that builds without error, padded with zeros to the widest member when that
 * size is known.
 */
Construct union_of(std::vector<Construct> members, std::optional<size_t> build_from = std::nullopt);

// repetition

Construct array(Expr count, Construct sub);
Construct range(size_t min, size_t max, Construct sub);
Construct greedy_range(Construct sub);
Construct repeat_until(Expr predicate, Construct sub);
Construct prefixed_array(Construct count, Construct sub);

// conditionals

using Cases = std::vector<std::pair<Value, Construct>>;

Construct switch_on(Expr key, Cases cases, std::optional<Construct> fallback = std::nullopt);
/** @brief Switch whose chosen case contributes its fields to the enclosing struct. */
Construct embedded_switch(Expr key, Cases cases, std::optional<Construct> fallback = std::nullopt);
Construct if_then_else(Expr predicate, Construct then_branch, Construct else_branch);
/** @brief @p then_branch when @p predicate holds, nothing otherwise. */
Construct when(Expr predicate, Construct then_branch);
/** @brief First alternative that parses, or builds, without error. */
Construct select(std::vector<Construct> alternatives);
/** @brief @p sub, or none when it does not apply. */
Construct maybe(Construct sub);

// stream

Construct peek(Construct sub);
Construct pointer(Expr offset, Construct sub);
Construct aligned(size_t modulus, Construct sub, uint8_t pattern = 0);
Construct padded(Expr length, Construct sub, uint8_t pattern = 0);
/**
 * @brief Captures the bytes of a fixed size @p sub and parses them on first use.
 *
 * Parsing yields a Deferred value; see `demand`. Building writes a deferred
 * value back as its captured bytes and anything else through @p sub.
 */
Construct on_demand(Construct sub);

// adapters

Construct adapt(Construct sub, Decoder decode, Encoder encode, Purity purity = Purity::Impure);
Construct expr_adapter(Construct sub, Expr decode, Expr encode);
Construct validated(Construct sub, Validator validate, Purity purity = Purity::Impure);
Construct one_of(Construct sub, std::vector<Value> allowed);
Construct none_of(Construct sub, std::vector<Value> forbidden);
Construct rebuild(Construct sub, Expr value);
Construct with_default(Construct sub, Value value);

// transforms

Construct transformed(Construct sub, ByteTransform decode, std::optional<size_t> decode_amount, ByteTransform encode,
                      std::optional<size_t> encode_amount);
Construct restream_data(Expr data, Construct sub);
Construct prefixed(Construct length, Construct sub, bool include_length = false);
/** @brief Reverses the bytes of a fixed size construct. */
Construct byte_swapped(Construct sub);
Construct raw_copy(Construct sub);
Construct checksum(Construct field, HashFunction hash, Expr data);
Construct named_tuple(std::vector<std::string> names, Construct sub);

} // namespace construe
