#include "codecs.hpp"

namespace construe::engine {

Result<Value> parse(const node::Adapter &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v)
        return v;

    Context ctx = s.context(frame, &io);
    Value out = std::move(*v);
    if (k.decode) {
        auto decoded = k.decode(out, ctx);
        if (!decoded)
            return std::unexpected(decoded.error().located(s.path));
        out = std::move(*decoded);
    }
    if (k.validate) {
        if (auto ok = k.validate(out, ctx); !ok)
            return std::unexpected(ok.error().located(s.path));
    }
    return out;
}

Result<size_t> build(const node::Adapter &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    Context ctx = s.context(frame, &io);
    if (k.validate) {
        if (auto ok = k.validate(value, ctx); !ok)
            return std::unexpected(ok.error().located(s.path));
    }
    if (!k.encode)
        return build(k.sub.node(), value, io, s, frame);

    auto encoded = k.encode(value, ctx);
    if (!encoded)
        return std::unexpected(encoded.error().located(s.path));
    return build(k.sub.node(), *encoded, io, s, frame);
}

Result<size_t> size_of(const node::Adapter &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

Result<Value> parse(const node::ExprAdapter &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v)
        return v;
    return eval(k.decode, s, frame, &io, &*v);
}

Result<size_t> build(const node::ExprAdapter &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto encoded = eval(k.encode, s, frame, &io, &value);
    if (!encoded)
        return std::unexpected(encoded.error());
    return build(k.sub.node(), *encoded, io, s, frame);
}

Result<size_t> size_of(const node::ExprAdapter &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

Result<Value> parse(const node::Rebuild &k, const Node &, Io &io, Session &s, FrameId frame) {
    return parse(k.sub.node(), io, s, frame);
}

Result<size_t> build(const node::Rebuild &k, const Node &, const Value &, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto v = eval(k.value, s, frame, &io);
    if (!v)
        return std::unexpected(v.error());
    auto n = build(k.sub.node(), *v, io, s, frame);
    if (n && built)
        *built = std::move(*v);
    return n;
}

Result<size_t> size_of(const node::Rebuild &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

Result<Value> parse(const node::Default &k, const Node &, Io &io, Session &s, FrameId frame) {
    return parse(k.sub.node(), io, s, frame);
}

Result<size_t> build(const node::Default &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    const Value &used = value.is_none() ? k.value : value;
    auto n = build(k.sub.node(), used, io, s, frame);
    if (n && built)
        *built = used;
    return n;
}

Result<size_t> size_of(const node::Default &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

} // namespace construe::engine
