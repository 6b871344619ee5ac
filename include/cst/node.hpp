#pragma once

#include "cst/construct.hpp"
#include "cst/context.hpp"
#include "cst/expr.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace construe {

enum class Endian : uint8_t { Big, Little };
enum class Encoding : uint8_t { Raw, Utf8 };
enum class Side : uint8_t { Left, Right };

/** @brief Whether adapter callbacks are plain value transforms the compiler may call directly. */
enum class Purity : uint8_t { Pure, Impure };

using Decoder = std::function<Result<Value>(const Value &obj, const Context &ctx)>;
using Encoder = std::function<Result<Value>(const Value &obj, const Context &ctx)>;
using Validator = std::function<Result<void>(const Value &obj, const Context &ctx)>;
using ByteTransform = std::function<Result<Bytes>(const Bytes &data, const Context &ctx)>;
using HashFunction = std::function<Result<Value>(const Bytes &data)>;

class Io;
struct RegistryTable;

/**
 * @brief Plugin interface for leaf encodings not shipped with the library.
 *
 * The context passed in carries the current path, so errors returned without a
 * path are located automatically.
 */
class LeafCodec {
public:
    virtual ~LeafCodec() = default;

    virtual std::string_view name() const = 0;
    virtual Result<Value> parse(Io &io, const Context &ctx) const = 0;
    virtual Result<size_t> build(const Value &value, Io &io, const Context &ctx) const = 0;

    virtual Result<size_t> size_of(const Context &ctx) const {
        return fail(ErrorKind::SizeofError, ctx.path(), std::string(name()) + " has no static size");
    }
};

namespace node {

struct BytesField {
    Expr length;
};
struct GreedyBytes {};
struct Integer {
    unsigned width;
    bool is_signed;
    Endian endian;
};
struct Float {
    unsigned width;
    Endian endian;
};
struct Flag {};
struct VarInt {};
struct PaddedString {
    Expr length;
    Encoding encoding;
    uint8_t pad;
    Side pad_side;
    Side trim_side;
};
struct CString {
    Encoding encoding;
};
struct GreedyString {
    Encoding encoding;
};
struct Computed {
    Expr value;
};
struct Pass {};
struct Terminator {};
struct Tell {};
struct Index {};
struct Padding {
    Expr length;
    uint8_t pattern;
    bool strict;
};
struct Const {
    Construct sub;
    Value value;
};
struct Check {
    Expr predicate;
};
struct Probe {
    std::string label;
};
struct Custom {
    std::shared_ptr<const LeafCodec> codec;
};

struct Struct {
    std::vector<Construct> fields;
};
struct Sequence {
    std::vector<Construct> items;
};
/** @brief Members overlaid on the same bytes. */
struct Union {
    std::vector<Construct> members;
    std::optional<size_t> build_from; ///< Member to build from, nullopt tries each in turn.
};

struct Array {
    Expr count;
    Construct sub;
};
struct Range {
    size_t min;
    size_t max;
    Construct sub;
};
struct RepeatUntil {
    Expr predicate; ///< Sees the element just parsed or built as `obj_()`.
    Construct sub;
};
struct PrefixedArray {
    Construct count;
    Construct sub;
};

struct Switch {
    Expr key;
    std::vector<std::pair<Value, Construct>> cases;
    std::optional<Construct> fallback;
};
struct IfThenElse {
    Expr predicate;
    Construct then_branch;
    Construct else_branch;
};
struct Select {
    std::vector<Construct> alternatives;
};

struct Peek {
    Construct sub;
};
struct Pointer {
    Expr offset;
    Construct sub;
};
struct Aligned {
    size_t modulus;
    uint8_t pattern;
    Construct sub;
};
struct Padded {
    Expr length;
    uint8_t pattern;
    Construct sub;
};
struct OnDemand {
    Construct sub;
};

/** @brief Runs @p sub over a stream of bits, one byte per bit, most significant first. */
struct Bitwise {
    Construct sub;
};
/** @brief Integer of @p bits bits, read from one byte per bit. */
struct BitsInteger {
    unsigned bits;
    bool is_signed;
};

struct Adapter {
    Construct sub;
    Decoder decode;
    Encoder encode;
    Validator validate;
    Purity purity;
};
struct ExprAdapter {
    Construct sub;
    Expr decode; ///< Sees the parsed value as `obj_()`.
    Expr encode; ///< Sees the value to build as `obj_()`.
};
struct Rebuild {
    Construct sub;
    Expr value;
};
struct Default {
    Construct sub;
    Value value;
};

struct Transformed {
    Construct sub;
    ByteTransform decode;
    std::optional<size_t> decode_amount; ///< Bytes read before decoding, nullopt reads to the end.
    ByteTransform encode;
    std::optional<size_t> encode_amount; ///< Required encoded size, nullopt accepts any.
};
struct RestreamData {
    Expr data;
    Construct sub;
};
struct Prefixed {
    Construct length;
    Construct sub;
    bool include_length;
};
struct RawCopy {
    Construct sub;
};
struct Checksum {
    Construct field;
    HashFunction hash;
    Expr data;
};
struct NamedTuple {
    std::vector<std::string> names;
    Construct sub;
};

struct Reference {
    std::weak_ptr<const RegistryTable> table;
    std::string name;
};

} // namespace node

/** @brief A schema node: a closed variant payload plus the properties every node carries. */
struct Node {
    using Kind = std::variant<node::BytesField, node::GreedyBytes, node::Integer, node::Float, node::Flag, node::VarInt,
                              node::PaddedString, node::CString, node::GreedyString, node::Computed, node::Pass,
                              node::Terminator, node::Tell, node::Index, node::Padding, node::Const, node::Check,
                              node::Probe, node::Custom, node::BitsInteger, node::Struct, node::Sequence,
                              node::Union, node::Array, node::Range, node::RepeatUntil, node::PrefixedArray,
                              node::Switch, node::IfThenElse, node::Select, node::Peek, node::Pointer,
                              node::Aligned, node::Padded, node::OnDemand, node::Bitwise, node::Adapter,
                              node::ExprAdapter, node::Rebuild, node::Default, node::Transformed,
                              node::RestreamData, node::Prefixed, node::RawCopy, node::Checksum, node::NamedTuple,
                              node::Reference>;

    Kind kind;
    std::string name;
    bool embedded = false;
    bool optional = false;
};

/** @brief Short lowercase name of the node's kind, used in diagnostics. */
std::string_view kind_name(const Node &node);

/** @brief False when a struct may build this field without a supplied value. */
bool needs_value(const Node &node);

/** @brief Direct sub-constructs of @p node, in declaration order. */
std::vector<Construct> children(const Node &node);

} // namespace construe
