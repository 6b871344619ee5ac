#include "cst/construct.hpp"

#include "codecs.hpp"
#include "cst/engine.hpp"
#include "cst/node.hpp"

#include <array>
#include <climits>
#include <cstdio>
#include <fmt/format.h>

namespace construe {

Construct::Construct(Node node) : node_(std::make_shared<const Node>(std::move(node))) {
}

const std::string &Construct::name() const {
    return node_->name;
}

bool Construct::is_embedded() const {
    return node_->embedded;
}

bool Construct::is_optional() const {
    return node_->optional;
}

Construct Construct::named(std::string name) const {
    Node copy = *node_;
    copy.name = std::move(name);
    return Construct(std::move(copy));
}

Construct Construct::embedded() const {
    Node copy = *node_;
    copy.embedded = true;
    return Construct(std::move(copy));
}

Construct Construct::optional() const {
    Node copy = *node_;
    copy.optional = true;
    return Construct(std::move(copy));
}

Result<Value> Construct::parse(std::span<const uint8_t> data, const Config &config) const {
    SpanStream stream(data);
    return parse_stream(stream, {}, config);
}

Result<Value> Construct::parse(std::string_view data, const Config &config) const {
    return parse(std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(data.data()), data.size()), config);
}

Result<Value> Construct::parse_stream(Stream &stream, const Container &context, const Config &config) const {
    Session session(config);
    FrameId root = session.arena.push(no_frame);
    session.arena.frame(root).values = context;
    Io io(stream);
    return engine::parse(*node_, io, session, root);
}

Result<Bytes> Construct::build(const Value &value, const Config &config) const {
    BufferStream out;
    auto written = build_stream(value, out, {}, config);
    if (!written)
        return std::unexpected(written.error());
    return out.take();
}

Result<size_t> Construct::build_stream(const Value &value, Stream &stream, const Container &context,
                                       const Config &config) const {
    Session session(config);
    FrameId root = session.arena.push(no_frame);
    session.arena.frame(root).values = context;
    Io io(stream);
    return engine::build(*node_, value, io, session, root);
}

Result<size_t> Construct::size_of(const Container &context) const {
    Session session;
    FrameId root = session.arena.push(no_frame);
    session.arena.frame(root).values = context;
    return engine::size_of(*node_, session, root);
}

namespace {

constexpr std::array<std::string_view, 47> kind_names = {
    "bytes",       "greedy_bytes", "integer",     "float",        "flag",      "varint",       "padded_string",
    "cstring",     "greedy_string", "computed",   "pass",         "terminator", "tell",        "index",
    "padding",     "const",        "check",       "probe",        "custom",    "bits_integer", "struct",
    "sequence",    "union",        "array",       "range",        "repeat_until", "prefixed_array", "switch",
    "if_then_else", "select",      "peek",        "pointer",      "aligned",   "padded",       "on_demand",
    "bitwise",     "adapter",      "expr_adapter", "rebuild",     "default",   "transformed",  "restream_data",
    "prefixed",    "raw_copy",     "checksum",    "named_tuple",  "reference",
};
static_assert(std::variant_size_v<Node::Kind> == kind_names.size());

} // namespace

std::string_view kind_name(const Node &node) {
    return kind_names[node.kind.index()];
}

bool needs_value(const Node &node) {
    if (node.optional)
        return false;
    return std::visit(
        [](const auto &k) {
            using T = std::decay_t<decltype(k)>;
            return !(std::is_same_v<T, node::Computed> || std::is_same_v<T, node::Pass> ||
                     std::is_same_v<T, node::Terminator> || std::is_same_v<T, node::Tell> ||
                     std::is_same_v<T, node::Index> || std::is_same_v<T, node::Padding> ||
                     std::is_same_v<T, node::Const> || std::is_same_v<T, node::Check> ||
                     std::is_same_v<T, node::Probe> || std::is_same_v<T, node::Rebuild> ||
                     std::is_same_v<T, node::Default> || std::is_same_v<T, node::Checksum> ||
                     std::is_same_v<T, node::Peek> || std::is_same_v<T, node::RestreamData>);
        },
        node.kind);
}

std::vector<Construct> children(const Node &node) {
    std::vector<Construct> out;
    std::visit(
        [&out](const auto &k) {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, node::Struct>) {
                out = k.fields;
            } else if constexpr (std::is_same_v<T, node::Sequence>) {
                out = k.items;
            } else if constexpr (std::is_same_v<T, node::Union>) {
                out = k.members;
            } else if constexpr (std::is_same_v<T, node::Select>) {
                out = k.alternatives;
            } else if constexpr (std::is_same_v<T, node::Switch>) {
                for (const auto &[key, c] : k.cases) {
                    out.push_back(c);
                }
                if (k.fallback)
                    out.push_back(*k.fallback);
            } else if constexpr (std::is_same_v<T, node::IfThenElse>) {
                out = {k.then_branch, k.else_branch};
            } else if constexpr (std::is_same_v<T, node::PrefixedArray>) {
                out = {k.count, k.sub};
            } else if constexpr (std::is_same_v<T, node::Prefixed>) {
                out = {k.length, k.sub};
            } else if constexpr (std::is_same_v<T, node::Checksum>) {
                out = {k.field};
            } else if constexpr (requires { k.sub; }) {
                out = {k.sub};
            }
        },
        node.kind);
    return out;
}

namespace engine {

Result<Value> parse(const Node &node, Io &io, Session &s, FrameId frame) {
    return std::visit([&](const auto &k) { return parse(k, node, io, s, frame); }, node.kind);
}

Result<size_t> build(const Node &node, const Value &value, Io &io, Session &s, FrameId frame, Value *built) {
    return std::visit([&](const auto &k) { return build(k, node, value, io, s, frame, built); }, node.kind);
}

Result<size_t> size_of(const Node &node, Session &s, FrameId frame) {
    return std::visit([&](const auto &k) { return size_of(k, node, s, frame); }, node.kind);
}

Result<Value> eval(const Expr &expr, Session &s, FrameId frame, const Io *io, const Value *obj) {
    return expr.eval(s.context(frame, io), obj);
}

Result<size_t> eval_count(const Expr &expr, Session &s, FrameId frame, const Io *io) {
    auto v = eval(expr, s, frame, io);
    if (!v)
        return std::unexpected(v.error());
    const auto *n = v->get<int64_t>();
    if (!n)
        return fail(ErrorKind::ArgumentError, s.path,
                    fmt::format("expected an integer count, got {}", v->type_name()));
    if (*n < 0)
        return fail(ErrorKind::ArgumentError, s.path, fmt::format("negative count {}", *n));
    return static_cast<size_t>(*n);
}

Result<size_t> eval_static_count(const Expr &expr, Session &s, FrameId frame) {
    auto n = eval_count(expr, s, frame, nullptr);
    if (!n)
        return fail(ErrorKind::SizeofError, s.path, fmt::format("size not determinable: {}", n.error().message()));
    return n;
}

Result<Value> decode_integer(std::span<const uint8_t> data, bool is_signed, Endian endian, const Path &path) {
    uint64_t raw = 0;
    for (size_t i = 0; i < data.size(); ++i) {
        uint8_t byte = endian == Endian::Big ? data[i] : data[data.size() - 1 - i];
        raw = (raw << 8) | byte;
    }
    unsigned bits = static_cast<unsigned>(data.size() * 8);
    if (is_signed) {
        if (bits < 64 && (raw >> (bits - 1)) & 1)
            raw |= ~uint64_t{0} << bits;
        return Value(static_cast<int64_t>(raw));
    }
    if (raw > static_cast<uint64_t>(INT64_MAX))
        return fail(ErrorKind::IntegerError, path, fmt::format("unsigned value {} exceeds the integer range", raw));
    return Value(static_cast<int64_t>(raw));
}

Result<Bytes> encode_integer(const Value &value, unsigned width, bool is_signed, Endian endian, const Path &path) {
    const auto *n = value.get<int64_t>();
    if (!n)
        return fail(ErrorKind::FormatFieldError, path, fmt::format("expected an integer, got {}", value.type_name()));

    unsigned bits = width * 8;
    bool in_range;
    if (is_signed) {
        in_range = bits == 64 || (*n >= -(int64_t{1} << (bits - 1)) && *n < (int64_t{1} << (bits - 1)));
    } else {
        in_range = *n >= 0 && (bits >= 63 || *n < (int64_t{1} << bits));
    }
    if (!in_range)
        return fail(ErrorKind::IntegerError, path,
                    fmt::format("{} out of range for {} {}-byte integer", *n, is_signed ? "signed" : "unsigned", width));

    auto raw = static_cast<uint64_t>(*n);
    Bytes out(width);
    for (unsigned i = 0; i < width; ++i) {
        uint8_t byte = static_cast<uint8_t>(raw >> (8 * i));
        out[endian == Endian::Big ? width - 1 - i : i] = byte;
    }
    return out;
}

void trace(const Session &s, std::string_view action, const Value &value) {
    if (s.config.trace)
        fmt::print(stderr, "[construe] {} {} = {}\n", action, s.path.str(), value.dump());
}

Result<Value> parse_window(const Node &node, std::span<const uint8_t> data, Session &s, FrameId frame) {
    SpanStream stream(data);
    Io window(stream);
    return parse(node, window, s, frame);
}

Result<Bytes> build_window(const Node &node, const Value &value, Session &s, FrameId frame, Value *built) {
    BufferStream out;
    Io window(out);
    auto written = build(node, value, window, s, frame, built);
    if (!written)
        return std::unexpected(written.error());
    return out.take();
}

} // namespace engine

} // namespace construe
