#include "codecs.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace construe::engine {

namespace {

Result<List> parse_elements(const Construct &sub, size_t count, Io &io, Session &s, FrameId frame) {
    IndexScope index(s.arena, frame);
    List out;
    out.reserve(std::min<size_t>(count, 4096));
    for (size_t i = 0; i < count; ++i) {
        index.set(i);
        PathScope scope(s.path, i);
        auto v = parse(sub.node(), io, s, frame);
        if (!v)
            return std::unexpected(v.error().wrapped(ErrorKind::IndexFieldError));
        out.push_back(std::move(*v));
    }
    return out;
}

Result<size_t> build_elements(const Construct &sub, const List &elements, Io &io, Session &s, FrameId frame) {
    IndexScope index(s.arena, frame);
    size_t total = 0;
    for (size_t i = 0; i < elements.size(); ++i) {
        index.set(i);
        PathScope scope(s.path, i);
        auto n = build(sub.node(), elements[i], io, s, frame);
        if (!n)
            return std::unexpected(n.error().wrapped(ErrorKind::IndexFieldError));
        total += *n;
    }
    return total;
}

} // namespace

Result<const List *> list_input(const Value &value, const Path &path) {
    if (const auto *l = value.get<List>())
        return l;
    return fail(ErrorKind::FormatFieldError, path, fmt::format("expected a list, got {}", value.type_name()));
}

Result<Value> parse(const node::Array &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto count = eval_count(k.count, s, frame, &io);
    if (!count)
        return std::unexpected(count.error());
    auto out = parse_elements(k.sub, *count, io, s, frame);
    if (!out)
        return std::unexpected(out.error());
    return Value(std::move(*out));
}

Result<size_t> build(const node::Array &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto elements = list_input(value, s.path);
    if (!elements)
        return std::unexpected(elements.error());
    auto count = eval_count(k.count, s, frame, &io);
    if (!count)
        return std::unexpected(count.error());
    if ((*elements)->size() != *count)
        return fail(ErrorKind::RepeatError, s.path,
                    fmt::format("expected {} elements, got {}", *count, (*elements)->size()));
    return build_elements(k.sub, **elements, io, s, frame);
}

Result<size_t> size_of(const node::Array &k, const Node &, Session &s, FrameId frame) {
    auto count = eval_static_count(k.count, s, frame);
    if (!count)
        return count;
    if (*count == 0)
        return 0;
    IndexScope index(s.arena, frame);
    index.set(0);
    auto each = size_of(k.sub.node(), s, frame);
    if (!each)
        return each;
    return *count * *each;
}

Result<Value> parse(const node::Range &k, const Node &, Io &io, Session &s, FrameId frame) {
    IndexScope index(s.arena, frame);
    List out;
    while (out.size() < k.max) {
        if (io.at_end())
            break;

        size_t mark = io.mark();
        index.set(out.size());
        PathScope scope(s.path, out.size());
        auto v = parse(k.sub.node(), io, s, frame);
        if (!v) {
            if (v.error().kind() == ErrorKind::StreamError) {
                io.rollback(mark);
                break;
            }
            io.commit(mark);
            return std::unexpected(v.error().wrapped(ErrorKind::IndexFieldError));
        }
        io.commit(mark);
        out.push_back(std::move(*v));
    }
    if (out.size() < k.min)
        return fail(ErrorKind::RepeatError, s.path,
                    fmt::format("expected at least {} elements, got {}", k.min, out.size()));
    return Value(std::move(out));
}

Result<size_t> build(const node::Range &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto elements = list_input(value, s.path);
    if (!elements)
        return std::unexpected(elements.error());
    size_t n = (*elements)->size();
    if (n < k.min || n > k.max)
        return fail(ErrorKind::RepeatError, s.path,
                    fmt::format("expected between {} and {} elements, got {}", k.min, k.max, n));
    return build_elements(k.sub, **elements, io, s, frame);
}

Result<size_t> size_of(const node::Range &k, const Node &, Session &s, FrameId frame) {
    if (k.min != k.max)
        return fail(ErrorKind::SizeofError, s.path, "size of a greedy repetition depends on the data");
    auto each = size_of(k.sub.node(), s, frame);
    if (!each)
        return each;
    return k.min * *each;
}

Result<Value> parse(const node::RepeatUntil &k, const Node &, Io &io, Session &s, FrameId frame) {
    IndexScope index(s.arena, frame);
    List out;
    for (size_t i = 0;; ++i) {
        index.set(i);
        PathScope scope(s.path, i);
        auto v = parse(k.sub.node(), io, s, frame);
        if (!v) {
            Error e = v.error().wrapped(ErrorKind::IndexFieldError);
            if (e.kind() == ErrorKind::StreamError)
                e = e.wrapped(ErrorKind::RepeatError);
            return std::unexpected(e);
        }
        out.push_back(std::move(*v));
        auto stop = eval(k.predicate, s, frame, &io, &out.back());
        if (!stop)
            return std::unexpected(stop.error());
        if (stop->truthy())
            break;
    }
    return Value(std::move(out));
}

Result<size_t> build(const node::RepeatUntil &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto elements = list_input(value, s.path);
    if (!elements)
        return std::unexpected(elements.error());

    IndexScope index(s.arena, frame);
    size_t total = 0;
    const List &list = **elements;
    for (size_t i = 0; i < list.size(); ++i) {
        index.set(i);
        PathScope scope(s.path, i);
        auto n = build(k.sub.node(), list[i], io, s, frame);
        if (!n)
            return std::unexpected(n.error().wrapped(ErrorKind::IndexFieldError));
        total += *n;

        auto stop = eval(k.predicate, s, frame, &io, &list[i]);
        if (!stop)
            return std::unexpected(stop.error());
        if (stop->truthy()) {
            if (i + 1 != list.size())
                return fail(ErrorKind::RepeatError, s.path,
                            fmt::format("{} elements follow the terminating element", list.size() - i - 1));
            return total;
        }
    }
    return fail(ErrorKind::RepeatError, s.path, "no element satisfies the terminating predicate");
}

Result<size_t> size_of(const node::RepeatUntil &, const Node &, Session &s, FrameId) {
    return fail(ErrorKind::SizeofError, s.path, "size of a terminated repetition depends on the data");
}

Result<Value> parse(const node::PrefixedArray &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto count = parse(k.count.node(), io, s, frame);
    if (!count)
        return count;
    const auto *n = count->get<int64_t>();
    if (!n || *n < 0)
        return fail(ErrorKind::ArgumentError, s.path, fmt::format("invalid element count {}", count->dump()));
    auto out = parse_elements(k.sub, static_cast<size_t>(*n), io, s, frame);
    if (!out)
        return std::unexpected(out.error());
    return Value(std::move(*out));
}

Result<size_t> build(const node::PrefixedArray &k, const Node &, const Value &value, Io &io, Session &s,
                     FrameId frame, Value *) {
    auto elements = list_input(value, s.path);
    if (!elements)
        return std::unexpected(elements.error());
    auto head = build(k.count.node(), Value((*elements)->size()), io, s, frame);
    if (!head)
        return head;
    auto body = build_elements(k.sub, **elements, io, s, frame);
    if (!body)
        return body;
    return *head + *body;
}

Result<size_t> size_of(const node::PrefixedArray &, const Node &, Session &s, FrameId) {
    return fail(ErrorKind::SizeofError, s.path, "size of a prefixed array depends on the data");
}

} // namespace construe::engine
