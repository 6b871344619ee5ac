#include "cst/deferred.hpp"

#include "codecs.hpp"

#include <fmt/format.h>

namespace construe {

bool Deferred::demanded() const {
    std::lock_guard lock(mutex_);
    return cached_.has_value();
}

Result<Value> Deferred::value() const {
    std::lock_guard lock(mutex_);
    if (!cached_) {
        SpanStream stream(data_);
        cached_ = sub_.parse_stream(stream, context_, config_);
    }
    return *cached_;
}

Result<Value> demand(const Value &value) {
    if (const auto *lazy = value.get<std::shared_ptr<const Deferred>>())
        return (*lazy)->value();
    return value;
}

namespace engine {

namespace {

/** @brief Every entry visible from @p frame, the nearest frame winning. */
Container snapshot(const ContextArena &arena, FrameId frame) {
    Container out;
    for (FrameId f = frame; f != no_frame; f = arena.frame(f).parent) {
        for (const auto &[key, v] : arena.frame(f).values) {
            out.insert(key, v);
        }
    }
    return out;
}

} // namespace

Result<Value> parse(const node::OnDemand &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto n = size_of(k.sub.node(), s, frame);
    if (!n)
        return fail(ErrorKind::SizeofError, s.path,
                    fmt::format("on-demand field needs a known size: {}", n.error().message()));
    auto data = io.read(*n, s.path);
    if (!data)
        return std::unexpected(data.error());
    return Value(std::make_shared<const Deferred>(k.sub, std::move(*data), snapshot(s.arena, frame), s.config));
}

Result<size_t> build(const node::OnDemand &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    // A deferred value goes back out as the bytes it was read from, demanded or not.
    if (const auto *lazy = value.get<std::shared_ptr<const Deferred>>())
        return io.write((*lazy)->data(), s.path);
    return build(k.sub.node(), value, io, s, frame, built);
}

Result<size_t> size_of(const node::OnDemand &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

} // namespace engine

} // namespace construe
