#include "codecs.hpp"

#include <fmt/format.h>

namespace construe::engine {

namespace {

Result<Bytes> bytes_of(const Result<Value> &v, const Path &path) {
    if (!v)
        return std::unexpected(v.error());
    if (const auto *b = v->get<Bytes>())
        return *b;
    return fail(ErrorKind::FormatFieldError, path, fmt::format("expected bytes, got {}", v->type_name()));
}

Result<size_t> length_prefix(const Value &v, const Path &path) {
    const auto *n = v.get<int64_t>();
    if (!n || *n < 0)
        return fail(ErrorKind::ArgumentError, path, fmt::format("invalid length prefix {}", v.dump()));
    return static_cast<size_t>(*n);
}

bool produces_list(const Node &node) {
    return std::holds_alternative<node::Sequence>(node.kind) || std::holds_alternative<node::Array>(node.kind) ||
           std::holds_alternative<node::Range>(node.kind) || std::holds_alternative<node::RepeatUntil>(node.kind) ||
           std::holds_alternative<node::PrefixedArray>(node.kind);
}

} // namespace

// position

Result<Value> parse(const node::Peek &k, const Node &, Io &io, Session &s, FrameId frame) {
    size_t mark = io.mark();
    auto v = parse(k.sub.node(), io, s, frame);
    io.rollback(mark);
    if (!v && v.error().kind() == ErrorKind::StreamError)
        return Value();
    return v;
}

Result<size_t> build(const node::Peek &, const Node &, const Value &, Io &, Session &, FrameId, Value *) {
    return 0;
}

Result<size_t> size_of(const node::Peek &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Pointer &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto offset = eval_count(k.offset, s, frame, &io);
    if (!offset)
        return std::unexpected(offset.error());
    return io.detour(*offset, s.path, [&] { return parse(k.sub.node(), io, s, frame); });
}

Result<size_t> build(const node::Pointer &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto offset = eval_count(k.offset, s, frame, &io);
    if (!offset)
        return std::unexpected(offset.error());
    auto n = io.detour(*offset, s.path, [&] { return build(k.sub.node(), value, io, s, frame); });
    if (!n)
        return n;
    return 0;
}

Result<size_t> size_of(const node::Pointer &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Aligned &k, const Node &, Io &io, Session &s, FrameId frame) {
    size_t start = io.offset();
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v)
        return v;
    size_t pad = (k.modulus - (io.offset() - start) % k.modulus) % k.modulus;
    if (auto skipped = io.read(pad, s.path); !skipped)
        return std::unexpected(skipped.error());
    return v;
}

Result<size_t> build(const node::Aligned &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto n = build(k.sub.node(), value, io, s, frame, built);
    if (!n)
        return n;
    size_t pad = (k.modulus - *n % k.modulus) % k.modulus;
    auto written = io.write(Bytes(pad, k.pattern), s.path);
    if (!written)
        return written;
    return *n + pad;
}

Result<size_t> size_of(const node::Aligned &k, const Node &, Session &s, FrameId frame) {
    auto n = size_of(k.sub.node(), s, frame);
    if (!n)
        return n;
    return *n + (k.modulus - *n % k.modulus) % k.modulus;
}

Result<Value> parse(const node::Padded &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto length = eval_count(k.length, s, frame, &io);
    if (!length)
        return std::unexpected(length.error());
    size_t start = io.offset();
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v)
        return v;
    size_t used = io.offset() - start;
    if (used > *length)
        return fail(ErrorKind::FormatFieldError, s.path,
                    fmt::format("content used {} bytes, more than the padded length {}", used, *length));
    if (auto skipped = io.read(*length - used, s.path); !skipped)
        return std::unexpected(skipped.error());
    return v;
}

Result<size_t> build(const node::Padded &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto length = eval_count(k.length, s, frame, &io);
    if (!length)
        return std::unexpected(length.error());
    auto n = build(k.sub.node(), value, io, s, frame, built);
    if (!n)
        return n;
    if (*n > *length)
        return fail(ErrorKind::FormatFieldError, s.path,
                    fmt::format("content used {} bytes, more than the padded length {}", *n, *length));
    auto written = io.write(Bytes(*length - *n, k.pattern), s.path);
    if (!written)
        return written;
    return *length;
}

Result<size_t> size_of(const node::Padded &k, const Node &, Session &s, FrameId frame) {
    return eval_static_count(k.length, s, frame);
}

// byte windows

Result<Value> parse(const node::Transformed &k, const Node &, Io &io, Session &s, FrameId frame) {
    Bytes raw;
    if (k.decode_amount) {
        auto r = io.read(*k.decode_amount, s.path);
        if (!r)
            return std::unexpected(r.error());
        raw = std::move(*r);
    } else {
        raw = io.read_all();
    }
    auto decoded = k.decode(raw, s.context(frame, &io));
    if (!decoded)
        return std::unexpected(decoded.error().located(s.path));
    return parse_window(k.sub.node(), *decoded, s, frame);
}

Result<size_t> build(const node::Transformed &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto data = build_window(k.sub.node(), value, s, frame, built);
    if (!data)
        return std::unexpected(data.error());
    auto encoded = k.encode(*data, s.context(frame, &io));
    if (!encoded)
        return std::unexpected(encoded.error().located(s.path));
    if (k.encode_amount && encoded->size() != *k.encode_amount)
        return fail(ErrorKind::FormatFieldError, s.path,
                    fmt::format("encoded {} bytes, expected {}", encoded->size(), *k.encode_amount));
    return io.write(*encoded, s.path);
}

Result<size_t> size_of(const node::Transformed &k, const Node &, Session &s, FrameId) {
    if (!k.decode_amount)
        return fail(ErrorKind::SizeofError, s.path, "size of a transform over the rest of the stream depends on the data");
    return *k.decode_amount;
}

Result<Value> parse(const node::RestreamData &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto data = bytes_of(eval(k.data, s, frame, &io), s.path);
    if (!data)
        return std::unexpected(data.error());
    return parse_window(k.sub.node(), *data, s, frame);
}

Result<size_t> build(const node::RestreamData &k, const Node &, const Value &value, Io &, Session &s, FrameId frame,
                     Value *) {
    if (value.is_none())
        return 0;
    auto data = build_window(k.sub.node(), value, s, frame, nullptr);
    if (!data)
        return std::unexpected(data.error());
    return 0;
}

Result<size_t> size_of(const node::RestreamData &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Prefixed &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto prefix = parse(k.length.node(), io, s, frame);
    if (!prefix)
        return prefix;
    auto n = length_prefix(*prefix, s.path);
    if (!n)
        return std::unexpected(n.error());
    if (k.include_length) {
        auto own = size_of(k.length.node(), s, frame);
        if (!own)
            return std::unexpected(own.error());
        if (*n < *own)
            return fail(ErrorKind::ArgumentError, s.path,
                        fmt::format("length prefix {} is shorter than itself", *n));
        *n -= *own;
    }
    auto data = io.read(*n, s.path);
    if (!data)
        return std::unexpected(data.error());
    return parse_window(k.sub.node(), *data, s, frame);
}

Result<size_t> build(const node::Prefixed &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto data = build_window(k.sub.node(), value, s, frame, built);
    if (!data)
        return std::unexpected(data.error());
    size_t length = data->size();
    if (k.include_length) {
        auto own = size_of(k.length.node(), s, frame);
        if (!own)
            return std::unexpected(own.error());
        length += *own;
    }
    auto head = build(k.length.node(), Value(length), io, s, frame);
    if (!head)
        return head;
    auto body = io.write(*data, s.path);
    if (!body)
        return body;
    return *head + *body;
}

Result<size_t> size_of(const node::Prefixed &k, const Node &, Session &s, FrameId frame) {
    auto head = size_of(k.length.node(), s, frame);
    if (!head)
        return head;
    auto body = size_of(k.sub.node(), s, frame);
    if (!body)
        return body;
    return *head + *body;
}

// bookkeeping

Result<Value> parse(const node::RawCopy &k, const Node &, Io &io, Session &s, FrameId frame) {
    size_t offset1 = io.offset();
    size_t mark = io.mark();
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v) {
        io.commit(mark);
        return std::unexpected(v.error().wrapped(ErrorKind::RawCopyError));
    }
    Bytes data = io.recorded(mark);
    io.commit(mark);
    size_t offset2 = io.offset();
    return Value(Container{{"data", std::move(data)},
                           {"value", std::move(*v)},
                           {"offset1", offset1},
                           {"offset2", offset2},
                           {"length", offset2 - offset1}});
}

Result<size_t> build(const node::RawCopy &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    const auto *c = value.get<Container>();
    if (!c)
        return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected a container, got {}", value.type_name()));

    size_t offset1 = io.offset();
    Bytes data;
    Value parsed;
    if (const Value *d = c->find("data"); d && d->holds<Bytes>()) {
        data = *d->get<Bytes>();
        auto v = parse_window(k.sub.node(), data, s, frame);
        if (!v)
            return std::unexpected(v.error().wrapped(ErrorKind::RawCopyError));
        parsed = std::move(*v);
    } else if (const Value *v = c->find("value")) {
        auto b = build_window(k.sub.node(), *v, s, frame, nullptr);
        if (!b)
            return std::unexpected(b.error().wrapped(ErrorKind::RawCopyError));
        data = std::move(*b);
        parsed = *v;
    } else {
        return fail(ErrorKind::MissingFieldError, s.path, "raw copy needs 'data' or 'value'");
    }

    auto n = io.write(data, s.path);
    if (!n)
        return n;
    if (built) {
        size_t offset2 = io.offset();
        *built = Value(Container{{"data", std::move(data)},
                                 {"value", std::move(parsed)},
                                 {"offset1", offset1},
                                 {"offset2", offset2},
                                 {"length", offset2 - offset1}});
    }
    return n;
}

Result<size_t> size_of(const node::RawCopy &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

Result<Value> parse(const node::Checksum &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto stored = parse(k.field.node(), io, s, frame);
    if (!stored)
        return stored;
    auto data = bytes_of(eval(k.data, s, frame, &io), s.path);
    if (!data)
        return std::unexpected(data.error());
    auto computed = k.hash(*data);
    if (!computed)
        return std::unexpected(computed.error().located(s.path));
    if (!(*stored == *computed))
        return fail(ErrorKind::CheckError, s.path,
                    fmt::format("checksum mismatch: stored {}, computed {}", stored->dump(), computed->dump()));
    return stored;
}

Result<size_t> build(const node::Checksum &k, const Node &, const Value &, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto data = bytes_of(eval(k.data, s, frame, &io), s.path);
    if (!data)
        return std::unexpected(data.error());
    auto computed = k.hash(*data);
    if (!computed)
        return std::unexpected(computed.error().located(s.path));
    auto n = build(k.field.node(), *computed, io, s, frame);
    if (n && built)
        *built = std::move(*computed);
    return n;
}

Result<size_t> size_of(const node::Checksum &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.field.node(), s, frame);
}

Result<Value> parse(const node::NamedTuple &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v)
        return v;

    Container out;
    if (const auto *list = v->get<List>()) {
        if (list->size() != k.names.size())
            return fail(ErrorKind::NamedTupleError, s.path,
                        fmt::format("{} names for {} values", k.names.size(), list->size()));
        for (size_t i = 0; i < list->size(); ++i) {
            out.set(k.names[i], (*list)[i]);
        }
        return Value(std::move(out));
    }
    if (const auto *c = v->get<Container>()) {
        for (const auto &name : k.names) {
            const Value *field = c->find(name);
            if (!field)
                return fail(ErrorKind::NamedTupleError, s.path, fmt::format("no field named '{}'", name));
            out.set(name, *field);
        }
        return Value(std::move(out));
    }
    return fail(ErrorKind::NamedTupleError, s.path, fmt::format("cannot name the fields of {}", v->type_name()));
}

Result<size_t> build(const node::NamedTuple &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    if (value.holds<List>())
        return build(k.sub.node(), value, io, s, frame);
    const auto *c = value.get<Container>();
    if (!c)
        return fail(ErrorKind::NamedTupleError, s.path, fmt::format("cannot build from {}", value.type_name()));

    bool as_list = produces_list(k.sub.node());
    List items;
    Container fields;
    for (const auto &name : k.names) {
        const Value *field = c->find(name);
        if (!field)
            return fail(ErrorKind::NamedTupleError, s.path, fmt::format("no field named '{}'", name));
        if (as_list)
            items.push_back(*field);
        else
            fields.set(name, *field);
    }
    return build(k.sub.node(), as_list ? Value(std::move(items)) : Value(std::move(fields)), io, s, frame);
}

Result<size_t> size_of(const node::NamedTuple &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

} // namespace construe::engine
