#include "codecs.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace construe::engine {

namespace {

Result<void> parse_fields(const std::vector<Construct> &fields, Io &io, Session &s, FrameId frame, Container &into) {
    for (const auto &field : fields) {
        const Node &f = field.node();
        if (f.embedded) {
            if (auto r = parse_embedded(f, io, s, frame, into); !r)
                return r;
            continue;
        }

        Value v;
        {
            PathScope scope(s.path, f.name);
            auto parsed = parse(f, io, s, frame);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (f.name.empty())
                continue;
            trace(s, "parsed", *parsed);
            v = std::move(*parsed);
        }
        if (auto r = store(s, frame, into, f.name, std::move(v)); !r)
            return r;
    }
    return {};
}

Result<size_t> build_fields(const std::vector<Construct> &fields, const Container &from, Io &io, Session &s,
                            FrameId frame, Names &built) {
    size_t total = 0;
    for (const auto &field : fields) {
        const Node &f = field.node();
        if (f.embedded) {
            auto n = build_embedded(f, from, io, s, frame, built);
            if (!n)
                return n;
            total += *n;
            continue;
        }
        if (!f.name.empty()) {
            if (auto r = claim(built, f.name, s.path); !r)
                return std::unexpected(r.error());
        }

        PathScope scope(s.path, f.name);
        Value input;
        if (!f.name.empty()) {
            auto v = field_input(f, from, s.path);
            if (!v)
                return std::unexpected(v.error());
            input = std::move(*v);
        }
        Value produced = input;
        auto n = build(f, input, io, s, frame, &produced);
        if (!n)
            return n;
        total += *n;
        if (!f.name.empty()) {
            trace(s, "built", produced);
            s.arena.frame(frame).values.set(f.name, std::move(produced));
        }
    }
    return total;
}

Result<size_t> size_of_fields(const std::vector<Construct> &fields, Session &s, FrameId frame) {
    size_t total = 0;
    for (const auto &field : fields) {
        const Node &f = field.node();
        Result<size_t> n;
        if (f.embedded) {
            n = size_of_embedded(f, s, frame);
        } else {
            PathScope scope(s.path, f.name);
            n = size_of(f, s, frame);
        }
        if (!n)
            return n;
        total += *n;
    }
    return total;
}

Result<void> parse_items(const std::vector<Construct> &items, Io &io, Session &s, FrameId frame, List &into) {
    for (const auto &item : items) {
        const Node &it = item.node();
        if (it.embedded) {
            if (const auto *nested = std::get_if<node::Sequence>(&it.kind)) {
                if (auto r = parse_items(nested->items, io, s, frame, into); !r)
                    return r;
                continue;
            }
        }

        auto parsed = [&] {
            if (it.name.empty()) {
                PathScope scope(s.path, into.size());
                return parse(it, io, s, frame);
            }
            PathScope scope(s.path, it.name);
            return parse(it, io, s, frame);
        }();
        if (!parsed)
            return std::unexpected(parsed.error());

        if (it.embedded && parsed->holds<List>()) {
            for (auto &element : *parsed->get<List>()) {
                into.push_back(std::move(element));
            }
            continue;
        }
        if (!it.name.empty())
            s.arena.frame(frame).values.set(it.name, *parsed);
        into.push_back(std::move(*parsed));
    }
    return {};
}

Result<size_t> build_items(const std::vector<Construct> &items, const List &from, size_t &cursor, Io &io, Session &s,
                           FrameId frame) {
    size_t total = 0;
    for (const auto &item : items) {
        const Node &it = item.node();
        if (it.embedded) {
            if (const auto *nested = std::get_if<node::Sequence>(&it.kind)) {
                auto n = build_items(nested->items, from, cursor, io, s, frame);
                if (!n)
                    return n;
                total += *n;
                continue;
            }
        }

        size_t position = cursor++;
        Value input;
        if (position < from.size()) {
            input = from[position];
        } else if (needs_value(it)) {
            PathScope scope(s.path, position);
            return fail(ErrorKind::MissingFieldError, s.path, fmt::format("missing element {}", position));
        }

        Value produced = input;
        Result<size_t> n = [&] {
            if (it.name.empty()) {
                PathScope scope(s.path, position);
                return build(it, input, io, s, frame, &produced);
            }
            PathScope scope(s.path, it.name);
            return build(it, input, io, s, frame, &produced);
        }();
        if (!n)
            return n;
        total += *n;
        if (!it.name.empty())
            s.arena.frame(frame).values.set(it.name, std::move(produced));
    }
    return total;
}

Result<size_t> size_of_items(const std::vector<Construct> &items, Session &s, FrameId frame) {
    size_t total = 0;
    for (const auto &item : items) {
        const Node &it = item.node();
        Result<size_t> n = [&] {
            if (it.embedded) {
                if (const auto *nested = std::get_if<node::Sequence>(&it.kind))
                    return size_of_items(nested->items, s, frame);
            }
            PathScope scope(s.path, it.name);
            return size_of(it, s, frame);
        }();
        if (!n)
            return n;
        total += *n;
    }
    return total;
}

} // namespace

Result<const Container *> container_input(const Value &value, const Container &empty, const Path &path) {
    if (const auto *c = value.get<Container>())
        return c;
    if (value.is_none())
        return &empty;
    return fail(ErrorKind::FormatFieldError, path, fmt::format("expected a container, got {}", value.type_name()));
}

Result<void> store(Session &s, FrameId frame, Container &into, const std::string &name, Value value) {
    if (into.contains(name))
        return fail(ErrorKind::OverwriteError, s.path, fmt::format("field '{}' is already set", name));
    s.arena.frame(frame).values.set(name, value);
    into.set(name, std::move(value));
    return {};
}

Result<void> claim(Names &built, const std::string &name, const Path &path) {
    if (!built.insert(name).second)
        return fail(ErrorKind::OverwriteError, path, fmt::format("field '{}' is already set", name));
    return {};
}

Result<Value> field_input(const Node &field, const Container &from, const Path &path) {
    if (const Value *v = from.find(field.name))
        return *v;
    if (!needs_value(field))
        return Value();
    return fail(ErrorKind::MissingFieldError, path, fmt::format("missing field '{}'", field.name));
}

Result<Value> parse(const node::Struct &k, const Node &, Io &io, Session &s, FrameId frame) {
    FrameScope scope(s.arena, frame);
    Container result;
    if (auto r = parse_fields(k.fields, io, s, scope.id(), result); !r)
        return std::unexpected(r.error());
    return Value(std::move(result));
}

Result<size_t> build(const node::Struct &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    Container empty;
    auto from = container_input(value, empty, s.path);
    if (!from)
        return std::unexpected(from.error());

    FrameScope scope(s.arena, frame);
    for (const auto &[key, v] : **from) {
        s.arena.frame(scope.id()).values.set(key, v);
    }
    Names built;
    return build_fields(k.fields, **from, io, s, scope.id(), built);
}

Result<size_t> size_of(const node::Struct &k, const Node &, Session &s, FrameId frame) {
    FrameScope scope(s.arena, frame);
    return size_of_fields(k.fields, s, scope.id());
}

Result<Value> parse(const node::Sequence &k, const Node &, Io &io, Session &s, FrameId frame) {
    FrameScope scope(s.arena, frame);
    List result;
    if (auto r = parse_items(k.items, io, s, scope.id(), result); !r)
        return std::unexpected(r.error());
    return Value(std::move(result));
}

Result<size_t> build(const node::Sequence &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    List empty;
    const List *from = value.get<List>();
    if (!from) {
        if (!value.is_none())
            return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected a list, got {}", value.type_name()));
        from = &empty;
    }

    FrameScope scope(s.arena, frame);
    size_t cursor = 0;
    auto n = build_items(k.items, *from, cursor, io, s, scope.id());
    if (n && cursor < from->size())
        return fail(ErrorKind::RepeatError, s.path,
                    fmt::format("expected {} elements, got {}", cursor, from->size()));
    return n;
}

Result<size_t> size_of(const node::Sequence &k, const Node &, Session &s, FrameId frame) {
    FrameScope scope(s.arena, frame);
    return size_of_items(k.items, s, scope.id());
}

// unions

namespace {

Result<void> parse_member(const Node &m, Io &io, Session &s, FrameId frame, Container &into) {
    if (m.embedded)
        return parse_embedded(m, io, s, frame, into);
    Value v;
    {
        PathScope scope(s.path, m.name);
        auto parsed = parse(m, io, s, frame);
        if (!parsed)
            return std::unexpected(parsed.error());
        if (m.name.empty())
            return {};
        trace(s, "parsed", *parsed);
        v = std::move(*parsed);
    }
    return store(s, frame, into, m.name, std::move(v));
}

Result<Bytes> build_member(const Node &m, const Container &from, Session &s, FrameId frame) {
    BufferStream out;
    Io window(out);
    if (m.embedded) {
        Names built;
        if (auto n = build_embedded(m, from, window, s, frame, built); !n)
            return std::unexpected(n.error());
        return out.take();
    }
    PathScope scope(s.path, m.name);
    Value input;
    if (!m.name.empty()) {
        auto v = field_input(m, from, s.path);
        if (!v)
            return std::unexpected(v.error());
        input = std::move(*v);
    }
    if (auto n = build(m, input, window, s, frame); !n)
        return std::unexpected(n.error());
    return out.take();
}

} // namespace

Result<Value> parse(const node::Union &k, const Node &, Io &io, Session &s, FrameId frame) {
    FrameScope scope(s.arena, frame);
    Container result;
    size_t start = io.offset();
    size_t widest = 0;
    for (const auto &member : k.members) {
        size_t mark = io.mark();
        auto r = parse_member(member.node(), io, s, scope.id(), result);
        widest = std::max(widest, io.offset() - start);
        io.rollback(mark);
        if (!r)
            return std::unexpected(r.error());
    }
    // Leave the stream after the widest member.
    if (auto skipped = io.read(widest, s.path); !skipped)
        return std::unexpected(skipped.error());
    return Value(std::move(result));
}

Result<size_t> build(const node::Union &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    Container empty;
    auto from = container_input(value, empty, s.path);
    if (!from)
        return std::unexpected(from.error());

    FrameScope scope(s.arena, frame);
    for (const auto &[key, v] : **from) {
        s.arena.frame(scope.id()).values.set(key, v);
    }

    Result<Bytes> data = fail(ErrorKind::SwitchError, s.path, "no member of the union is present in the value");
    if (k.build_from) {
        data = build_member(k.members[*k.build_from].node(), **from, s, scope.id());
    } else {
        for (const auto &member : k.members) {
            const Node &m = member.node();
            if (!m.embedded && !m.name.empty() && !(*from)->contains(m.name))
                continue;
            data = build_member(m, **from, s, scope.id());
            if (data)
                break;
        }
    }
    if (!data)
        return std::unexpected(data.error());

    // Pad to the widest member so the union occupies the same space it parses from.
    if (auto width = size_of(k, self, s, scope.id()); width && data->size() < *width)
        data->resize(*width, 0);
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::Union &k, const Node &, Session &s, FrameId frame) {
    FrameScope scope(s.arena, frame);
    size_t widest = 0;
    for (const auto &member : k.members) {
        const Node &m = member.node();
        Result<size_t> n = [&] {
            if (m.embedded)
                return size_of_embedded(m, s, scope.id());
            PathScope path(s.path, m.name);
            return size_of(m, s, scope.id());
        }();
        if (!n)
            return n;
        widest = std::max(widest, *n);
    }
    return widest;
}

Result<void> parse_embedded(const Node &node, Io &io, Session &s, FrameId frame, Container &into) {
    if (const auto *k = std::get_if<node::Struct>(&node.kind))
        return parse_fields(k->fields, io, s, frame, into);
    if (std::holds_alternative<node::Pass>(node.kind))
        return {};

    const Construct *chosen = nullptr;
    if (const auto *k = std::get_if<node::Switch>(&node.kind)) {
        auto c = select_case(*k, s, frame, &io);
        if (!c)
            return std::unexpected(c.error());
        chosen = *c;
    } else if (const auto *k = std::get_if<node::IfThenElse>(&node.kind)) {
        auto c = select_branch(*k, s, frame, &io);
        if (!c)
            return std::unexpected(c.error());
        chosen = *c;
    } else if (const auto *k = std::get_if<node::Reference>(&node.kind)) {
        auto target = resolve(*k, s.path);
        if (!target)
            return std::unexpected(target.error());
        return parse_embedded(target->node(), io, s, frame, into);
    }
    if (chosen)
        return parse_embedded(chosen->node(), io, s, frame, into);

    auto v = parse(node, io, s, frame);
    if (!v)
        return std::unexpected(v.error());
    if (v->is_none())
        return {};
    auto *c = v->get<Container>();
    if (!c)
        return fail(ErrorKind::FormatFieldError, s.path,
                    fmt::format("embedded {} produced {}, not a container", kind_name(node), v->type_name()));
    for (const auto &[key, item] : *c) {
        if (auto r = store(s, frame, into, key, item); !r)
            return r;
    }
    return {};
}

Result<size_t> build_embedded(const Node &node, const Container &from, Io &io, Session &s, FrameId frame,
                              Names &built) {
    if (const auto *k = std::get_if<node::Struct>(&node.kind))
        return build_fields(k->fields, from, io, s, frame, built);
    if (std::holds_alternative<node::Pass>(node.kind))
        return 0;

    if (const auto *k = std::get_if<node::Switch>(&node.kind)) {
        auto c = select_case(*k, s, frame, &io);
        if (!c)
            return std::unexpected(c.error());
        return build_embedded((*c)->node(), from, io, s, frame, built);
    }
    if (const auto *k = std::get_if<node::IfThenElse>(&node.kind)) {
        auto c = select_branch(*k, s, frame, &io);
        if (!c)
            return std::unexpected(c.error());
        return build_embedded((*c)->node(), from, io, s, frame, built);
    }
    if (const auto *k = std::get_if<node::Reference>(&node.kind)) {
        auto target = resolve(*k, s.path);
        if (!target)
            return std::unexpected(target.error());
        return build_embedded(target->node(), from, io, s, frame, built);
    }
    return build(node, Value(from), io, s, frame);
}

Result<size_t> size_of_embedded(const Node &node, Session &s, FrameId frame) {
    if (const auto *k = std::get_if<node::Struct>(&node.kind))
        return size_of_fields(k->fields, s, frame);

    if (const auto *k = std::get_if<node::Switch>(&node.kind)) {
        auto c = select_case(*k, s, frame, nullptr);
        if (!c)
            return fail(ErrorKind::SizeofError, s.path, fmt::format("size not determinable: {}", c.error().message()));
        return size_of_embedded((*c)->node(), s, frame);
    }
    if (const auto *k = std::get_if<node::IfThenElse>(&node.kind)) {
        auto c = select_branch(*k, s, frame, nullptr);
        if (!c)
            return fail(ErrorKind::SizeofError, s.path, fmt::format("size not determinable: {}", c.error().message()));
        return size_of_embedded((*c)->node(), s, frame);
    }
    return size_of(node, s, frame);
}

} // namespace construe::engine
