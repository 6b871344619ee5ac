#include "cst/compiler.hpp"

#include "codecs.hpp"
#include "cst/registry.hpp"

#include <algorithm>
#include <cstdio>
#include <fmt/format.h>
#include <unordered_set>

namespace construe {

/** @brief One node of a lowered schema. */
struct CompiledProgram::Op {
    enum class Code : uint8_t {
        Record,     ///< Struct of fixed width leaves, read or written in one go.
        Fields,     ///< Struct.
        Items,      ///< Sequence without embedded items.
        Repeat,     ///< Array. subs[0] is the element.
        Prefixed,   ///< Prefixed array. subs[0] is the count, subs[1] the element.
        Branch,     ///< Switch. subs follow the cases, then the default.
        Choice,     ///< If/then/else.
        Mapped,     ///< Expression adapter.
        Adapted,    ///< Pure adapter.
        Rebuilt,
        Defaulted,
        Computed,
        Int,
        FixedBytes,
        Inline,     ///< Non-recursive reference, bound at compile time.
        Embedded,   ///< Embedded field merged by the interpreter.
        Interpret,
    };

    /** @brief A leaf inside a fused record. */
    struct Slot {
        enum class Kind : uint8_t { Int, Bytes, Skip };

        Kind kind;
        size_t offset;
        size_t width;
        Construct src;
    };

    Code code;
    Construct src;
    std::vector<Op> subs;
    std::vector<Slot> slots;
    size_t width = 0; ///< Record total, Int and FixedBytes size, bulk element width.
    bool bulk = false;
};

namespace {

using Op = CompiledProgram::Op;
using Code = Op::Code;
using Slot = Op::Slot;

// Larger arrays are read element by element so a hostile count cannot force a huge read.
constexpr size_t bulk_limit = size_t{1} << 20;

struct Lowering {
    const CompileOptions &options;
    Path path;
    std::vector<Fallback> fallbacks;
    std::vector<std::string> leaves;
};

Op interpret(const Construct &c, Lowering &l, std::string reason, Code code = Code::Interpret) {
    if (l.options.verbose)
        fmt::print(stderr, "[construe] interpreting {} at {}: {}\n", kind_name(c.node()), l.path.str(), reason);
    l.fallbacks.push_back({l.path.str(), std::string(kind_name(c.node())), std::move(reason)});
    return Op{code, c};
}

Op leaf_callback(const Construct &c, Lowering &l, std::string name) {
    if (std::find(l.leaves.begin(), l.leaves.end(), name) == l.leaves.end())
        l.leaves.push_back(std::move(name));
    return Op{Code::Interpret, c};
}

std::optional<size_t> constant_count(const Expr &expr) {
    const Value *v = expr.constant();
    if (!v)
        return std::nullopt;
    const auto *n = v->get<int64_t>();
    if (!n || *n < 0)
        return std::nullopt;
    return static_cast<size_t>(*n);
}

std::optional<Slot> record_slot(const Construct &c, size_t offset) {
    const Node &self = c.node();
    if (self.embedded)
        return std::nullopt;
    if (const auto *k = std::get_if<node::Integer>(&self.kind))
        return Slot{Slot::Kind::Int, offset, k->width, c};
    if (const auto *k = std::get_if<node::BytesField>(&self.kind)) {
        if (auto n = constant_count(k->length))
            return Slot{Slot::Kind::Bytes, offset, *n, c};
    }
    if (const auto *k = std::get_if<node::Padding>(&self.kind); k && !k->strict) {
        if (auto n = constant_count(k->length))
            return Slot{Slot::Kind::Skip, offset, *n, c};
    }
    return std::nullopt;
}

std::optional<Op> lower_record(const Construct &c, const node::Struct &k) {
    if (k.fields.empty())
        return std::nullopt;
    Op op{Code::Record, c};
    std::unordered_set<std::string> names;
    for (const auto &f : k.fields) {
        auto slot = record_slot(f, op.width);
        if (!slot)
            return std::nullopt;
        if (!f.name().empty() && !names.insert(f.name()).second)
            return std::nullopt;
        op.width += slot->width;
        op.slots.push_back(std::move(*slot));
    }
    return op;
}

Result<Op> lower(const Construct &c, Lowering &l);

Result<void> lower_fields(const std::vector<Construct> &fields, Lowering &l, std::vector<Op> &out) {
    for (const auto &f : fields) {
        const Node &self = f.node();
        if (self.embedded) {
            if (const auto *k = std::get_if<node::Struct>(&self.kind)) {
                if (auto r = lower_fields(k->fields, l, out); !r)
                    return r;
            } else if (!std::holds_alternative<node::Pass>(self.kind)) {
                out.push_back(interpret(f, l, "embedded field", Code::Embedded));
            }
            continue;
        }
        PathScope scope(l.path, self.name);
        auto op = lower(f, l);
        if (!op)
            return std::unexpected(op.error());
        out.push_back(std::move(*op));
    }
    return {};
}

Result<void> lower_element(const Construct &sub, Lowering &l, Op &op) {
    auto element = lower(sub, l);
    if (!element)
        return std::unexpected(element.error());
    if (l.options.bulk_arrays && element->code == Code::Int) {
        op.bulk = true;
        op.width = element->width;
    }
    op.subs.push_back(std::move(*element));
    return {};
}

Result<Op> lower_children(Op op, const std::vector<const Construct *> &children, Lowering &l) {
    for (const Construct *child : children) {
        auto sub = lower(*child, l);
        if (!sub)
            return std::unexpected(sub.error());
        op.subs.push_back(std::move(*sub));
    }
    return op;
}

Result<Op> lower(const Construct &c, Lowering &l) {
    const Node &self = c.node();
    return std::visit(
        [&](const auto &k) -> Result<Op> {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, node::Integer>) {
                Op op{Code::Int, c};
                op.width = k.width;
                return op;
            } else if constexpr (std::is_same_v<T, node::BytesField>) {
                if (auto n = constant_count(k.length)) {
                    Op op{Code::FixedBytes, c};
                    op.width = *n;
                    return op;
                }
                if (!k.length.is_static())
                    return interpret(c, l, "opaque lambda");
                return leaf_callback(c, l, "bytes");
            } else if constexpr (std::is_same_v<T, node::Computed>) {
                if (!k.value.is_static())
                    return interpret(c, l, "opaque lambda");
                return Op{Code::Computed, c};
            } else if constexpr (std::is_same_v<T, node::PaddedString> || std::is_same_v<T, node::Padding>) {
                if (!k.length.is_static())
                    return interpret(c, l, "opaque lambda");
                return leaf_callback(c, l, std::string(kind_name(self)));
            } else if constexpr (std::is_same_v<T, node::Check>) {
                if (!k.predicate.is_static())
                    return interpret(c, l, "opaque lambda");
                return leaf_callback(c, l, "check");
            } else if constexpr (std::is_same_v<T, node::Custom>) {
                return leaf_callback(c, l, fmt::format("custom:{}", k.codec->name()));
            } else if constexpr (std::is_same_v<T, node::GreedyBytes> || std::is_same_v<T, node::Float> ||
                                 std::is_same_v<T, node::Flag> || std::is_same_v<T, node::VarInt> ||
                                 std::is_same_v<T, node::CString> || std::is_same_v<T, node::GreedyString> ||
                                 std::is_same_v<T, node::Pass> || std::is_same_v<T, node::Terminator> ||
                                 std::is_same_v<T, node::Tell> || std::is_same_v<T, node::Index> ||
                                 std::is_same_v<T, node::Const>) {
                return leaf_callback(c, l, std::string(kind_name(self)));
            } else if constexpr (std::is_same_v<T, node::BitsInteger>) {
                return leaf_callback(c, l, "bits_integer");
            } else if constexpr (std::is_same_v<T, node::Probe>) {
                return interpret(c, l, "probe");
            } else if constexpr (std::is_same_v<T, node::Struct>) {
                if (l.options.fuse_records) {
                    if (auto record = lower_record(c, k))
                        return std::move(*record);
                }
                Op op{Code::Fields, c};
                if (auto r = lower_fields(k.fields, l, op.subs); !r)
                    return std::unexpected(r.error());
                return op;
            } else if constexpr (std::is_same_v<T, node::Sequence>) {
                if (std::ranges::any_of(k.items, [](const Construct &item) { return item.is_embedded(); }))
                    return interpret(c, l, "embedded sequence item");
                Op op{Code::Items, c};
                for (size_t i = 0; i < k.items.size(); ++i) {
                    const Construct &item = k.items[i];
                    auto sub = [&] {
                        if (item.name().empty()) {
                            PathScope scope(l.path, i);
                            return lower(item, l);
                        }
                        PathScope scope(l.path, item.name());
                        return lower(item, l);
                    }();
                    if (!sub)
                        return std::unexpected(sub.error());
                    op.subs.push_back(std::move(*sub));
                }
                return op;
            } else if constexpr (std::is_same_v<T, node::Array>) {
                if (!k.count.is_static())
                    return interpret(c, l, "opaque lambda");
                Op op{Code::Repeat, c};
                if (auto r = lower_element(k.sub, l, op); !r)
                    return std::unexpected(r.error());
                return op;
            } else if constexpr (std::is_same_v<T, node::PrefixedArray>) {
                auto count = lower(k.count, l);
                if (!count)
                    return std::unexpected(count.error());
                Op op{Code::Prefixed, c};
                op.subs.push_back(std::move(*count));
                if (auto r = lower_element(k.sub, l, op); !r)
                    return std::unexpected(r.error());
                return op;
            } else if constexpr (std::is_same_v<T, node::Range> || std::is_same_v<T, node::RepeatUntil>) {
                return interpret(c, l, "greedy repetition");
            } else if constexpr (std::is_same_v<T, node::Switch>) {
                if (!k.key.is_static())
                    return interpret(c, l, "opaque lambda");
                std::vector<const Construct *> children;
                for (const auto &[key, sub] : k.cases) {
                    children.push_back(&sub);
                }
                if (k.fallback)
                    children.push_back(&*k.fallback);
                return lower_children(Op{Code::Branch, c}, children, l);
            } else if constexpr (std::is_same_v<T, node::IfThenElse>) {
                if (!k.predicate.is_static())
                    return interpret(c, l, "opaque lambda");
                return lower_children(Op{Code::Choice, c}, {&k.then_branch, &k.else_branch}, l);
            } else if constexpr (std::is_same_v<T, node::Select>) {
                return interpret(c, l, "alternatives");
            } else if constexpr (std::is_same_v<T, node::Peek> || std::is_same_v<T, node::Pointer>) {
                return interpret(c, l, "stream repositioning");
            } else if constexpr (std::is_same_v<T, node::Aligned> || std::is_same_v<T, node::Padded>) {
                return interpret(c, l, "stream alignment");
            } else if constexpr (std::is_same_v<T, node::Union>) {
                return interpret(c, l, "overlapping members");
            } else if constexpr (std::is_same_v<T, node::Bitwise>) {
                return interpret(c, l, "bit stream");
            } else if constexpr (std::is_same_v<T, node::OnDemand>) {
                return interpret(c, l, "deferred parse");
            } else if constexpr (std::is_same_v<T, node::ExprAdapter>) {
                if (!k.decode.is_static() || !k.encode.is_static())
                    return interpret(c, l, "opaque lambda");
                return lower_children(Op{Code::Mapped, c}, {&k.sub}, l);
            } else if constexpr (std::is_same_v<T, node::Adapter>) {
                if (k.purity != Purity::Pure)
                    return interpret(c, l, "impure adapter");
                return lower_children(Op{Code::Adapted, c}, {&k.sub}, l);
            } else if constexpr (std::is_same_v<T, node::Rebuild>) {
                if (!k.value.is_static())
                    return interpret(c, l, "opaque lambda");
                return lower_children(Op{Code::Rebuilt, c}, {&k.sub}, l);
            } else if constexpr (std::is_same_v<T, node::Default>) {
                return lower_children(Op{Code::Defaulted, c}, {&k.sub}, l);
            } else if constexpr (std::is_same_v<T, node::Reference>) {
                auto target = engine::resolve(k, l.path);
                if (!target)
                    return std::unexpected(target.error());
                auto table = k.table.lock();
                if (table && is_recursive(*table, k.name))
                    return interpret(c, l, "recursive reference");
                return lower_children(Op{Code::Inline, c}, {&*target}, l);
            } else {
                return interpret(c, l, "byte transform");
            }
        },
        self.kind);
}

// execution

Result<Value> run_parse(const Op &op, Io &io, Session &s, FrameId frame);
Result<size_t> run_build(const Op &op, const Value &value, Io &io, Session &s, FrameId frame, Value *built = nullptr);

Result<Value> parse_record(const Op &op, Io &io, Session &s, FrameId parent) {
    FrameScope scope(s.arena, parent);
    Bytes data = io.read_up_to(op.width);
    std::span<const uint8_t> view(data);
    Container result;
    for (const auto &slot : op.slots) {
        const Node &self = slot.src.node();
        Value v;
        {
            PathScope at(s.path, self.name);
            if (slot.offset + slot.width > data.size())
                return fail(ErrorKind::StreamError, s.path,
                            fmt::format("expected {} bytes, found {}", slot.width, data.size() - slot.offset));
            auto bytes = view.subspan(slot.offset, slot.width);
            if (slot.kind == Slot::Kind::Int) {
                const auto &k = std::get<node::Integer>(self.kind);
                auto decoded = engine::decode_integer(bytes, k.is_signed, k.endian, s.path);
                if (!decoded)
                    return decoded;
                v = std::move(*decoded);
            } else if (slot.kind == Slot::Kind::Bytes) {
                v = Value(Bytes(bytes.begin(), bytes.end()));
            }
            if (self.name.empty())
                continue;
            engine::trace(s, "parsed", v);
        }
        if (auto r = engine::store(s, scope.id(), result, self.name, std::move(v)); !r)
            return std::unexpected(r.error());
    }
    return Value(std::move(result));
}

/** Writes the encoded prefix of a record, reporting a short write against the slot it hit. */
Result<size_t> write_slots(const std::vector<Slot> &slots, std::span<const uint8_t> data, Io &io, Session &s) {
    size_t written = io.write_up_to(data);
    if (written == data.size())
        return written;
    for (const auto &slot : slots) {
        if (slot.offset + slot.width > written) {
            PathScope at(s.path, slot.src.node().name);
            return fail(ErrorKind::StreamError, s.path,
                        fmt::format("wrote {} of {} bytes", written - slot.offset, slot.width));
        }
    }
    return fail(ErrorKind::StreamError, s.path, fmt::format("wrote {} of {} bytes", written, data.size()));
}

Result<size_t> build_record(const Op &op, const Value &value, Io &io, Session &s, FrameId parent) {
    Container empty;
    auto from = engine::container_input(value, empty, s.path);
    if (!from)
        return std::unexpected(from.error());

    FrameScope scope(s.arena, parent);
    for (const auto &[key, v] : **from) {
        s.arena.frame(scope.id()).values.set(key, v);
    }

    Bytes out;
    out.reserve(op.width);
    for (const auto &slot : op.slots) {
        const Node &self = slot.src.node();
        PathScope at(s.path, self.name);
        Value input;
        if (!self.name.empty()) {
            auto v = engine::field_input(self, **from, s.path);
            if (!v) {
                Error e = v.error();
                if (auto w = write_slots(op.slots, out, io, s); !w)
                    return w;
                return std::unexpected(std::move(e));
            }
            input = std::move(*v);
        }

        Value produced = input;
        Result<Bytes> encoded = [&]() -> Result<Bytes> {
            if (slot.kind == Slot::Kind::Int) {
                const auto &k = std::get<node::Integer>(self.kind);
                return engine::encode_integer(input, k.width, k.is_signed, k.endian, s.path);
            }
            return engine::build_window(self, input, s, scope.id(), &produced);
        }();
        if (!encoded) {
            Error e = encoded.error();
            if (auto w = write_slots(op.slots, out, io, s); !w)
                return w;
            return std::unexpected(std::move(e));
        }
        out.insert(out.end(), encoded->begin(), encoded->end());
        if (!self.name.empty()) {
            engine::trace(s, "built", produced);
            s.arena.frame(scope.id()).values.set(self.name, std::move(produced));
        }
    }
    return write_slots(op.slots, out, io, s);
}

Result<void> parse_fields(const std::vector<Op> &fields, Io &io, Session &s, FrameId frame, Container &into) {
    for (const auto &f : fields) {
        const Node &self = f.src.node();
        if (f.code == Code::Embedded) {
            if (auto r = engine::parse_embedded(self, io, s, frame, into); !r)
                return r;
            continue;
        }

        Value v;
        {
            PathScope scope(s.path, self.name);
            auto parsed = run_parse(f, io, s, frame);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (self.name.empty())
                continue;
            engine::trace(s, "parsed", *parsed);
            v = std::move(*parsed);
        }
        if (auto r = engine::store(s, frame, into, self.name, std::move(v)); !r)
            return r;
    }
    return {};
}

Result<size_t> build_fields(const std::vector<Op> &fields, const Container &from, Io &io, Session &s, FrameId frame) {
    size_t total = 0;
    engine::Names built;
    for (const auto &f : fields) {
        const Node &self = f.src.node();
        if (f.code == Code::Embedded) {
            auto n = engine::build_embedded(self, from, io, s, frame, built);
            if (!n)
                return n;
            total += *n;
            continue;
        }
        if (!self.name.empty()) {
            if (auto r = engine::claim(built, self.name, s.path); !r)
                return std::unexpected(r.error());
        }

        PathScope scope(s.path, self.name);
        Value input;
        if (!self.name.empty()) {
            auto v = engine::field_input(self, from, s.path);
            if (!v)
                return std::unexpected(v.error());
            input = std::move(*v);
        }
        Value produced = input;
        auto n = run_build(f, input, io, s, frame, &produced);
        if (!n)
            return n;
        total += *n;
        if (!self.name.empty()) {
            engine::trace(s, "built", produced);
            s.arena.frame(frame).values.set(self.name, std::move(produced));
        }
    }
    return total;
}

Result<Value> parse_items(const Op &op, Io &io, Session &s, FrameId parent) {
    FrameScope scope(s.arena, parent);
    List result;
    for (const auto &item : op.subs) {
        const Node &self = item.src.node();
        auto parsed = [&] {
            if (self.name.empty()) {
                PathScope at(s.path, result.size());
                return run_parse(item, io, s, scope.id());
            }
            PathScope at(s.path, self.name);
            return run_parse(item, io, s, scope.id());
        }();
        if (!parsed)
            return parsed;
        if (!self.name.empty())
            s.arena.frame(scope.id()).values.set(self.name, *parsed);
        result.push_back(std::move(*parsed));
    }
    return Value(std::move(result));
}

Result<size_t> build_items(const Op &op, const Value &value, Io &io, Session &s, FrameId parent) {
    List empty;
    const List *from = value.get<List>();
    if (!from) {
        if (!value.is_none())
            return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected a list, got {}", value.type_name()));
        from = &empty;
    }

    FrameScope scope(s.arena, parent);
    size_t total = 0;
    for (size_t position = 0; position < op.subs.size(); ++position) {
        const Op &item = op.subs[position];
        const Node &self = item.src.node();
        Value input;
        if (position < from->size()) {
            input = (*from)[position];
        } else if (needs_value(self)) {
            PathScope at(s.path, position);
            return fail(ErrorKind::MissingFieldError, s.path, fmt::format("missing element {}", position));
        }

        Value produced = input;
        Result<size_t> n = [&] {
            if (self.name.empty()) {
                PathScope at(s.path, position);
                return run_build(item, input, io, s, scope.id(), &produced);
            }
            PathScope at(s.path, self.name);
            return run_build(item, input, io, s, scope.id(), &produced);
        }();
        if (!n)
            return n;
        total += *n;
        if (!self.name.empty())
            s.arena.frame(scope.id()).values.set(self.name, std::move(produced));
    }
    if (op.subs.size() < from->size())
        return fail(ErrorKind::RepeatError, s.path,
                    fmt::format("expected {} elements, got {}", op.subs.size(), from->size()));
    return total;
}

Result<Value> parse_bulk(const Op &element, size_t count, Io &io, Session &s) {
    const auto &k = std::get<node::Integer>(element.src.node().kind);
    Bytes data = io.read_up_to(count * k.width);
    std::span<const uint8_t> view(data);
    size_t whole = data.size() / k.width;

    List out;
    out.reserve(whole);
    for (size_t i = 0; i < whole; ++i) {
        PathScope at(s.path, i);
        auto v = engine::decode_integer(view.subspan(i * k.width, k.width), k.is_signed, k.endian, s.path);
        if (!v)
            return std::unexpected(v.error().wrapped(ErrorKind::IndexFieldError));
        out.push_back(std::move(*v));
    }
    if (whole < count) {
        PathScope at(s.path, whole);
        Error e(ErrorKind::StreamError, s.path, fmt::format("expected {} bytes, found {}", k.width, data.size() % k.width));
        return std::unexpected(e.wrapped(ErrorKind::IndexFieldError));
    }
    return Value(std::move(out));
}

Result<size_t> write_elements(size_t width, std::span<const uint8_t> data, Io &io, Session &s) {
    size_t written = io.write_up_to(data);
    if (written == data.size())
        return written;
    PathScope at(s.path, written / width);
    Error e(ErrorKind::StreamError, s.path, fmt::format("wrote {} of {} bytes", written % width, width));
    return std::unexpected(e.wrapped(ErrorKind::IndexFieldError));
}

Result<size_t> build_bulk(const Op &element, const List &elements, Io &io, Session &s) {
    const auto &k = std::get<node::Integer>(element.src.node().kind);
    Bytes out;
    out.reserve(elements.size() * k.width);
    for (size_t i = 0; i < elements.size(); ++i) {
        PathScope at(s.path, i);
        auto encoded = engine::encode_integer(elements[i], k.width, k.is_signed, k.endian, s.path);
        if (!encoded) {
            Error e = encoded.error().wrapped(ErrorKind::IndexFieldError);
            if (auto w = write_elements(k.width, out, io, s); !w)
                return w;
            return std::unexpected(std::move(e));
        }
        out.insert(out.end(), encoded->begin(), encoded->end());
    }
    return write_elements(k.width, out, io, s);
}

Result<Value> parse_elements(const Op &op, const Op &element, size_t count, Io &io, Session &s, FrameId frame) {
    if (op.bulk && count <= bulk_limit / op.width)
        return parse_bulk(element, count, io, s);

    IndexScope index(s.arena, frame);
    List out;
    out.reserve(std::min<size_t>(count, 4096));
    for (size_t i = 0; i < count; ++i) {
        index.set(i);
        PathScope at(s.path, i);
        auto v = run_parse(element, io, s, frame);
        if (!v)
            return std::unexpected(v.error().wrapped(ErrorKind::IndexFieldError));
        out.push_back(std::move(*v));
    }
    return Value(std::move(out));
}

Result<size_t> build_elements(const Op &op, const Op &element, const List &elements, Io &io, Session &s,
                              FrameId frame) {
    if (op.bulk && elements.size() <= bulk_limit / op.width)
        return build_bulk(element, elements, io, s);

    IndexScope index(s.arena, frame);
    size_t total = 0;
    for (size_t i = 0; i < elements.size(); ++i) {
        index.set(i);
        PathScope at(s.path, i);
        auto n = run_build(element, elements[i], io, s, frame);
        if (!n)
            return std::unexpected(n.error().wrapped(ErrorKind::IndexFieldError));
        total += *n;
    }
    return total;
}

/** Position in subs of the case select_case chose. The default, when present, comes last. */
size_t case_position(const node::Switch &k, const Construct *chosen) {
    for (size_t i = 0; i < k.cases.size(); ++i) {
        if (&k.cases[i].second == chosen)
            return i;
    }
    return k.cases.size();
}

Result<Value> run_parse(const Op &op, Io &io, Session &s, FrameId frame) {
    const Node &self = op.src.node();
    switch (op.code) {
    case Code::Record:
        return parse_record(op, io, s, frame);
    case Code::Fields: {
        FrameScope scope(s.arena, frame);
        Container result;
        if (auto r = parse_fields(op.subs, io, s, scope.id(), result); !r)
            return std::unexpected(r.error());
        return Value(std::move(result));
    }
    case Code::Items:
        return parse_items(op, io, s, frame);
    case Code::Repeat: {
        auto count = engine::eval_count(std::get<node::Array>(self.kind).count, s, frame, &io);
        if (!count)
            return std::unexpected(count.error());
        return parse_elements(op, op.subs[0], *count, io, s, frame);
    }
    case Code::Prefixed: {
        auto count = run_parse(op.subs[0], io, s, frame);
        if (!count)
            return count;
        const auto *n = count->get<int64_t>();
        if (!n || *n < 0)
            return fail(ErrorKind::ArgumentError, s.path, fmt::format("invalid element count {}", count->dump()));
        return parse_elements(op, op.subs[1], static_cast<size_t>(*n), io, s, frame);
    }
    case Code::Branch: {
        const auto &k = std::get<node::Switch>(self.kind);
        auto chosen = engine::select_case(k, s, frame, &io);
        if (!chosen)
            return std::unexpected(chosen.error());
        return run_parse(op.subs[case_position(k, *chosen)], io, s, frame);
    }
    case Code::Choice: {
        const auto &k = std::get<node::IfThenElse>(self.kind);
        auto chosen = engine::select_branch(k, s, frame, &io);
        if (!chosen)
            return std::unexpected(chosen.error());
        return run_parse(op.subs[*chosen == &k.then_branch ? 0 : 1], io, s, frame);
    }
    case Code::Mapped: {
        auto v = run_parse(op.subs[0], io, s, frame);
        if (!v)
            return v;
        return engine::eval(std::get<node::ExprAdapter>(self.kind).decode, s, frame, &io, &*v);
    }
    case Code::Adapted: {
        const auto &k = std::get<node::Adapter>(self.kind);
        auto v = run_parse(op.subs[0], io, s, frame);
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
    case Code::Rebuilt:
    case Code::Defaulted:
    case Code::Inline:
        return run_parse(op.subs[0], io, s, frame);
    case Code::Computed:
        return engine::parse(std::get<node::Computed>(self.kind), self, io, s, frame);
    case Code::Int: {
        const auto &k = std::get<node::Integer>(self.kind);
        auto data = io.read(k.width, s.path);
        if (!data)
            return std::unexpected(data.error());
        return engine::decode_integer(*data, k.is_signed, k.endian, s.path);
    }
    case Code::FixedBytes: {
        auto data = io.read(op.width, s.path);
        if (!data)
            return std::unexpected(data.error());
        return Value(std::move(*data));
    }
    case Code::Embedded:
    case Code::Interpret:
        break;
    }
    return engine::parse(self, io, s, frame);
}

Result<size_t> run_build(const Op &op, const Value &value, Io &io, Session &s, FrameId frame, Value *built) {
    const Node &self = op.src.node();
    switch (op.code) {
    case Code::Record:
        return build_record(op, value, io, s, frame);
    case Code::Fields: {
        Container empty;
        auto from = engine::container_input(value, empty, s.path);
        if (!from)
            return std::unexpected(from.error());
        FrameScope scope(s.arena, frame);
        for (const auto &[key, v] : **from) {
            s.arena.frame(scope.id()).values.set(key, v);
        }
        return build_fields(op.subs, **from, io, s, scope.id());
    }
    case Code::Items:
        return build_items(op, value, io, s, frame);
    case Code::Repeat: {
        auto elements = engine::list_input(value, s.path);
        if (!elements)
            return std::unexpected(elements.error());
        auto count = engine::eval_count(std::get<node::Array>(self.kind).count, s, frame, &io);
        if (!count)
            return std::unexpected(count.error());
        if ((*elements)->size() != *count)
            return fail(ErrorKind::RepeatError, s.path,
                        fmt::format("expected {} elements, got {}", *count, (*elements)->size()));
        return build_elements(op, op.subs[0], **elements, io, s, frame);
    }
    case Code::Prefixed: {
        auto elements = engine::list_input(value, s.path);
        if (!elements)
            return std::unexpected(elements.error());
        auto head = run_build(op.subs[0], Value((*elements)->size()), io, s, frame);
        if (!head)
            return head;
        auto body = build_elements(op, op.subs[1], **elements, io, s, frame);
        if (!body)
            return body;
        return *head + *body;
    }
    case Code::Branch: {
        const auto &k = std::get<node::Switch>(self.kind);
        auto chosen = engine::select_case(k, s, frame, &io);
        if (!chosen)
            return std::unexpected(chosen.error());
        return run_build(op.subs[case_position(k, *chosen)], value, io, s, frame, built);
    }
    case Code::Choice: {
        const auto &k = std::get<node::IfThenElse>(self.kind);
        auto chosen = engine::select_branch(k, s, frame, &io);
        if (!chosen)
            return std::unexpected(chosen.error());
        return run_build(op.subs[*chosen == &k.then_branch ? 0 : 1], value, io, s, frame, built);
    }
    case Code::Mapped: {
        auto encoded = engine::eval(std::get<node::ExprAdapter>(self.kind).encode, s, frame, &io, &value);
        if (!encoded)
            return std::unexpected(encoded.error());
        return run_build(op.subs[0], *encoded, io, s, frame);
    }
    case Code::Adapted: {
        const auto &k = std::get<node::Adapter>(self.kind);
        Context ctx = s.context(frame, &io);
        if (k.validate) {
            if (auto ok = k.validate(value, ctx); !ok)
                return std::unexpected(ok.error().located(s.path));
        }
        if (!k.encode)
            return run_build(op.subs[0], value, io, s, frame);
        auto encoded = k.encode(value, ctx);
        if (!encoded)
            return std::unexpected(encoded.error().located(s.path));
        return run_build(op.subs[0], *encoded, io, s, frame);
    }
    case Code::Rebuilt: {
        auto v = engine::eval(std::get<node::Rebuild>(self.kind).value, s, frame, &io);
        if (!v)
            return std::unexpected(v.error());
        auto n = run_build(op.subs[0], *v, io, s, frame);
        if (n && built)
            *built = std::move(*v);
        return n;
    }
    case Code::Defaulted: {
        const auto &k = std::get<node::Default>(self.kind);
        const Value &used = value.is_none() ? k.value : value;
        auto n = run_build(op.subs[0], used, io, s, frame);
        if (n && built)
            *built = used;
        return n;
    }
    case Code::Inline:
        return run_build(op.subs[0], value, io, s, frame, built);
    case Code::Computed:
        return engine::build(std::get<node::Computed>(self.kind), self, value, io, s, frame, built);
    case Code::Int: {
        const auto &k = std::get<node::Integer>(self.kind);
        auto data = engine::encode_integer(value, k.width, k.is_signed, k.endian, s.path);
        if (!data)
            return std::unexpected(data.error());
        return io.write(*data, s.path);
    }
    case Code::FixedBytes:
        return engine::build(std::get<node::BytesField>(self.kind), self, value, io, s, frame, built);
    case Code::Embedded:
    case Code::Interpret:
        break;
    }
    return engine::build(self, value, io, s, frame, built);
}

std::string describe(const Value &v) {
    return v.dump();
}

std::string describe(const Bytes &b) {
    return fmt::format("{} bytes", b.size());
}

template <typename T>
std::string describe(const Result<T> &r) {
    return r ? describe(*r) : r.error().what();
}

template <typename T>
Result<void> compare(std::string_view stage, const Result<T> &expected, const Result<T> &actual) {
    bool same;
    if (expected.has_value() != actual.has_value()) {
        same = false;
    } else if (expected) {
        same = *expected == *actual;
    } else {
        const Error &a = expected.error();
        const Error &b = actual.error();
        same = a.kind() == b.kind() && a.path() == b.path() && a.message() == b.message() &&
               a.wrappers() == b.wrappers();
    }
    if (same)
        return {};
    return fail(ErrorKind::CheckError, {},
                fmt::format("compiled {} differs: interpreted {}, compiled {}", stage, describe(expected),
                            describe(actual)));
}

} // namespace

Result<Value> CompiledProgram::parse(std::span<const uint8_t> data, const Config &config) const {
    SpanStream stream(data);
    return parse_stream(stream, {}, config);
}

Result<Value> CompiledProgram::parse(std::string_view data, const Config &config) const {
    return parse(std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(data.data()), data.size()), config);
}

Result<Value> CompiledProgram::parse_stream(Stream &stream, const Container &context, const Config &config) const {
    Session session(config);
    FrameId root = session.arena.push(no_frame);
    session.arena.frame(root).values = context;
    Io io(stream);
    return run_parse(*root_, io, session, root);
}

Result<Bytes> CompiledProgram::build(const Value &value, const Config &config) const {
    BufferStream out;
    auto written = build_stream(value, out, {}, config);
    if (!written)
        return std::unexpected(written.error());
    return out.take();
}

Result<size_t> CompiledProgram::build_stream(const Value &value, Stream &stream, const Container &context,
                                             const Config &config) const {
    Session session(config);
    FrameId root = session.arena.push(no_frame);
    session.arena.frame(root).values = context;
    Io io(stream);
    return run_build(*root_, value, io, session, root);
}

Result<size_t> CompiledProgram::size_of(const Container &context) const {
    if (static_size_ && context.empty())
        return *static_size_;
    return source_.size_of(context);
}

Result<void> CompiledProgram::verify(const Construct &reference, std::span<const uint8_t> sample) const {
    auto expected = reference.parse(sample);
    auto actual = parse(sample);
    if (auto r = compare("parse", expected, actual); !r)
        return r;
    if (!expected)
        return {};
    return compare("build", reference.build(*expected), build(*expected));
}

Result<CompiledProgram> compile(const Construct &construct, const CompileOptions &options) {
    Lowering lowering{options, {}, {}, {}};
    auto root = lower(construct, lowering);
    if (!root)
        return std::unexpected(root.error());

    CompiledProgram program(construct);
    program.root_ = std::make_shared<const CompiledProgram::Op>(std::move(*root));
    if (auto size = construct.size_of())
        program.static_size_ = *size;
    program.leaf_callbacks_ = std::move(lowering.leaves);
    program.fallbacks_ = std::move(lowering.fallbacks);

    if (options.verbose)
        fmt::print(stderr, "[construe] compiled {}: {} fallbacks, {} leaf callbacks, size {}\n",
                   kind_name(construct.node()), program.fallbacks_.size(), program.leaf_callbacks_.size(),
                   program.static_size_ ? std::to_string(*program.static_size_) : "variable");
    return program;
}

} // namespace construe
