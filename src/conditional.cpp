#include "codecs.hpp"

#include <fmt/format.h>

namespace construe::engine {

Result<const Construct *> select_case(const node::Switch &k, Session &s, FrameId frame, const Io *io) {
    auto key = eval(k.key, s, frame, io);
    if (!key)
        return std::unexpected(key.error());
    for (const auto &[match, c] : k.cases) {
        if (*key == match)
            return &c;
    }
    if (k.fallback)
        return &*k.fallback;
    return fail(ErrorKind::SwitchError, s.path, fmt::format("no matching case for key {}", key->dump()));
}

Result<const Construct *> select_branch(const node::IfThenElse &k, Session &s, FrameId frame, const Io *io) {
    auto condition = eval(k.predicate, s, frame, io);
    if (!condition)
        return std::unexpected(condition.error());
    return condition->truthy() ? &k.then_branch : &k.else_branch;
}

namespace {

Result<size_t> undeterminable(const Session &s, const Error &cause) {
    return fail(ErrorKind::SizeofError, s.path, fmt::format("size not determinable: {}", cause.message()));
}

} // namespace

Result<Value> parse(const node::Switch &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto chosen = select_case(k, s, frame, &io);
    if (!chosen)
        return std::unexpected(chosen.error());
    return parse((*chosen)->node(), io, s, frame);
}

Result<size_t> build(const node::Switch &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto chosen = select_case(k, s, frame, &io);
    if (!chosen)
        return std::unexpected(chosen.error());
    return build((*chosen)->node(), value, io, s, frame, built);
}

Result<size_t> size_of(const node::Switch &k, const Node &, Session &s, FrameId frame) {
    auto chosen = select_case(k, s, frame, nullptr);
    if (!chosen)
        return undeterminable(s, chosen.error());
    return size_of((*chosen)->node(), s, frame);
}

Result<Value> parse(const node::IfThenElse &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto chosen = select_branch(k, s, frame, &io);
    if (!chosen)
        return std::unexpected(chosen.error());
    return parse((*chosen)->node(), io, s, frame);
}

Result<size_t> build(const node::IfThenElse &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto chosen = select_branch(k, s, frame, &io);
    if (!chosen)
        return std::unexpected(chosen.error());
    return build((*chosen)->node(), value, io, s, frame, built);
}

Result<size_t> size_of(const node::IfThenElse &k, const Node &, Session &s, FrameId frame) {
    auto chosen = select_branch(k, s, frame, nullptr);
    if (!chosen)
        return undeterminable(s, chosen.error());
    return size_of((*chosen)->node(), s, frame);
}

Result<Value> parse(const node::Select &k, const Node &, Io &io, Session &s, FrameId frame) {
    std::string last = "no alternatives";
    for (const auto &alternative : k.alternatives) {
        size_t mark = io.mark();
        auto v = parse(alternative.node(), io, s, frame);
        if (v) {
            io.commit(mark);
            return v;
        }
        io.rollback(mark);
        last = v.error().what();
    }
    return fail(ErrorKind::SwitchError, s.path, fmt::format("no alternative matched, last: {}", last));
}

Result<size_t> build(const node::Select &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    std::string last = "no alternatives";
    for (const auto &alternative : k.alternatives) {
        auto data = build_window(alternative.node(), value, s, frame, built);
        if (data)
            return io.write(*data, s.path);
        last = data.error().what();
    }
    return fail(ErrorKind::SwitchError, s.path, fmt::format("no alternative could build the value, last: {}", last));
}

Result<size_t> size_of(const node::Select &k, const Node &, Session &s, FrameId frame) {
    std::optional<size_t> common;
    for (const auto &alternative : k.alternatives) {
        auto n = size_of(alternative.node(), s, frame);
        if (!n)
            return n;
        if (common && *common != *n)
            return fail(ErrorKind::SizeofError, s.path, "alternatives differ in size");
        common = *n;
    }
    if (!common)
        return fail(ErrorKind::SizeofError, s.path, "no alternatives");
    return *common;
}

} // namespace construe::engine
