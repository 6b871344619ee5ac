#include "codecs.hpp"

#include <algorithm>
#include <bit>
#include <cstdio>
#include <cstring>
#include <fmt/format.h>

namespace construe::engine {

namespace {

Result<size_t> undeterminable(const Session &s, std::string_view what) {
    return fail(ErrorKind::SizeofError, s.path, fmt::format("size of {} depends on the data", what));
}

bool valid_utf8(const Bytes &data) {
    size_t i = 0;
    while (i < data.size()) {
        uint8_t c = data[i];
        size_t extra;
        if (c < 0x80)
            extra = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
            extra = 1;
        else if ((c & 0xF0) == 0xE0)
            extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
            extra = 3;
        else
            return false;
        if (i + extra >= data.size())
            return false;
        for (size_t j = 1; j <= extra; ++j) {
            if ((data[i + j] & 0xC0) != 0x80)
                return false;
        }
        i += extra + 1;
    }
    return true;
}

Result<Bytes> encode_text(const Value &value, Encoding encoding, const Path &path) {
    if (encoding == Encoding::Raw) {
        if (const auto *b = value.get<Bytes>())
            return *b;
        if (value.holds<std::string>())
            return fail(ErrorKind::StringError, path, "expected bytes, got text");
        return fail(ErrorKind::FormatFieldError, path, fmt::format("expected bytes, got {}", value.type_name()));
    }
    if (const auto *t = value.get<std::string>())
        return to_bytes(*t);
    if (value.holds<Bytes>())
        return fail(ErrorKind::StringError, path, "expected text, got bytes");
    return fail(ErrorKind::FormatFieldError, path, fmt::format("expected text, got {}", value.type_name()));
}

Result<Value> decode_text(Bytes data, Encoding encoding, const Path &path) {
    if (encoding == Encoding::Raw)
        return Value(std::move(data));
    if (!valid_utf8(data))
        return fail(ErrorKind::StringError, path, "invalid UTF-8");
    return Value(std::string(data.begin(), data.end()));
}

template <typename T>
T load_float(const Bytes &data, Endian endian) {
    using U = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
    U raw = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        uint8_t byte = endian == Endian::Big ? data[i] : data[sizeof(T) - 1 - i];
        raw = static_cast<U>((raw << 8) | byte);
    }
    return std::bit_cast<T>(raw);
}

template <typename T>
Bytes store_float(T value, Endian endian) {
    using U = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
    auto raw = std::bit_cast<U>(value);
    Bytes out(sizeof(T));
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[endian == Endian::Big ? sizeof(T) - 1 - i : i] = static_cast<uint8_t>(raw >> (8 * i));
    }
    return out;
}

} // namespace

// bytes

Result<Value> parse(const node::BytesField &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto n = eval_count(k.length, s, frame, &io);
    if (!n)
        return std::unexpected(n.error());
    auto data = io.read(*n, s.path);
    if (!data)
        return std::unexpected(data.error());
    return Value(std::move(*data));
}

Result<size_t> build(const node::BytesField &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto data = encode_text(value, Encoding::Raw, s.path);
    if (!data)
        return std::unexpected(data.error());
    auto n = eval_count(k.length, s, frame, &io);
    if (!n)
        return std::unexpected(n.error());
    if (data->size() != *n)
        return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected {} bytes, given {}", *n, data->size()));
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::BytesField &k, const Node &, Session &s, FrameId frame) {
    return eval_static_count(k.length, s, frame);
}

Result<Value> parse(const node::GreedyBytes &, const Node &, Io &io, Session &, FrameId) {
    return Value(io.read_all());
}

Result<size_t> build(const node::GreedyBytes &, const Node &, const Value &value, Io &io, Session &s, FrameId,
                     Value *) {
    auto data = encode_text(value, Encoding::Raw, s.path);
    if (!data)
        return std::unexpected(data.error());
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::GreedyBytes &, const Node &, Session &s, FrameId) {
    return undeterminable(s, "greedy bytes");
}

// numbers

Result<Value> parse(const node::Integer &k, const Node &, Io &io, Session &s, FrameId) {
    auto data = io.read(k.width, s.path);
    if (!data)
        return std::unexpected(data.error());
    return decode_integer(*data, k.is_signed, k.endian, s.path);
}

Result<size_t> build(const node::Integer &k, const Node &, const Value &value, Io &io, Session &s, FrameId,
                     Value *) {
    auto data = encode_integer(value, k.width, k.is_signed, k.endian, s.path);
    if (!data)
        return std::unexpected(data.error());
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::Integer &k, const Node &, Session &, FrameId) {
    return k.width;
}

Result<Value> parse(const node::Float &k, const Node &, Io &io, Session &s, FrameId) {
    auto data = io.read(k.width, s.path);
    if (!data)
        return std::unexpected(data.error());
    if (k.width == 4)
        return Value(static_cast<double>(load_float<float>(*data, k.endian)));
    return Value(load_float<double>(*data, k.endian));
}

Result<size_t> build(const node::Float &k, const Node &, const Value &value, Io &io, Session &s, FrameId, Value *) {
    double v;
    if (const auto *d = value.get<double>())
        v = *d;
    else if (const auto *i = value.get<int64_t>())
        v = static_cast<double>(*i);
    else
        return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected a number, got {}", value.type_name()));
    Bytes data = k.width == 4 ? store_float(static_cast<float>(v), k.endian) : store_float(v, k.endian);
    return io.write(data, s.path);
}

Result<size_t> size_of(const node::Float &k, const Node &, Session &, FrameId) {
    return k.width;
}

Result<Value> parse(const node::Flag &, const Node &, Io &io, Session &s, FrameId) {
    auto data = io.read(1, s.path);
    if (!data)
        return std::unexpected(data.error());
    return Value((*data)[0] != 0);
}

Result<size_t> build(const node::Flag &, const Node &, const Value &value, Io &io, Session &s, FrameId, Value *) {
    const auto *b = value.get<bool>();
    if (!b)
        return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected a bool, got {}", value.type_name()));
    const uint8_t byte = *b ? 1 : 0;
    return io.write({&byte, 1}, s.path);
}

Result<size_t> size_of(const node::Flag &, const Node &, Session &, FrameId) {
    return 1;
}

Result<Value> parse(const node::VarInt &, const Node &, Io &io, Session &s, FrameId) {
    uint64_t acc = 0;
    for (unsigned shift = 0;; shift += 7) {
        if (shift > 56)
            return fail(ErrorKind::IntegerError, s.path, "varint exceeds the integer range");
        auto byte = io.read(1, s.path);
        if (!byte)
            return std::unexpected(byte.error());
        uint8_t b = (*byte)[0];
        acc |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80))
            break;
    }
    return Value(static_cast<int64_t>(acc));
}

Result<size_t> build(const node::VarInt &, const Node &, const Value &value, Io &io, Session &s, FrameId, Value *) {
    const auto *n = value.get<int64_t>();
    if (!n)
        return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected an integer, got {}", value.type_name()));
    if (*n < 0)
        return fail(ErrorKind::IntegerError, s.path, fmt::format("varint cannot encode negative value {}", *n));
    auto raw = static_cast<uint64_t>(*n);
    Bytes out;
    do {
        uint8_t b = raw & 0x7F;
        raw >>= 7;
        out.push_back(raw ? (b | 0x80) : b);
    } while (raw);
    return io.write(out, s.path);
}

Result<size_t> size_of(const node::VarInt &, const Node &, Session &s, FrameId) {
    return undeterminable(s, "varint");
}

// strings

Result<Value> parse(const node::PaddedString &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto n = eval_count(k.length, s, frame, &io);
    if (!n)
        return std::unexpected(n.error());
    auto data = io.read(*n, s.path);
    if (!data)
        return std::unexpected(data.error());
    if (k.pad_side == Side::Right) {
        while (!data->empty() && data->back() == k.pad)
            data->pop_back();
    } else {
        auto first = std::ranges::find_if(*data, [&k](uint8_t b) { return b != k.pad; });
        data->erase(data->begin(), first);
    }
    return decode_text(std::move(*data), k.encoding, s.path);
}

Result<size_t> build(const node::PaddedString &k, const Node &, const Value &value, Io &io, Session &s,
                     FrameId frame, Value *) {
    auto data = encode_text(value, k.encoding, s.path);
    if (!data)
        return std::unexpected(data.error());
    auto n = eval_count(k.length, s, frame, &io);
    if (!n)
        return std::unexpected(n.error());

    if (data->size() > *n) {
        if (k.trim_side == Side::Right)
            data->resize(*n);
        else
            data->erase(data->begin(), data->end() - static_cast<std::ptrdiff_t>(*n));
    } else if (k.pad_side == Side::Right) {
        data->resize(*n, k.pad);
    } else {
        data->insert(data->begin(), *n - data->size(), k.pad);
    }
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::PaddedString &k, const Node &, Session &s, FrameId frame) {
    return eval_static_count(k.length, s, frame);
}

Result<Value> parse(const node::CString &k, const Node &, Io &io, Session &s, FrameId) {
    Bytes data;
    while (true) {
        auto byte = io.read(1, s.path);
        if (!byte)
            return std::unexpected(byte.error());
        if ((*byte)[0] == 0)
            break;
        data.push_back((*byte)[0]);
    }
    return decode_text(std::move(data), k.encoding, s.path);
}

Result<size_t> build(const node::CString &k, const Node &, const Value &value, Io &io, Session &s, FrameId,
                     Value *) {
    auto data = encode_text(value, k.encoding, s.path);
    if (!data)
        return std::unexpected(data.error());
    if (std::ranges::find(*data, uint8_t{0}) != data->end())
        return fail(ErrorKind::StringError, s.path, "string contains the terminator byte");
    data->push_back(0);
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::CString &, const Node &, Session &s, FrameId) {
    return undeterminable(s, "a C string");
}

Result<Value> parse(const node::GreedyString &k, const Node &, Io &io, Session &s, FrameId) {
    return decode_text(io.read_all(), k.encoding, s.path);
}

Result<size_t> build(const node::GreedyString &k, const Node &, const Value &value, Io &io, Session &s, FrameId,
                     Value *) {
    auto data = encode_text(value, k.encoding, s.path);
    if (!data)
        return std::unexpected(data.error());
    return io.write(*data, s.path);
}

Result<size_t> size_of(const node::GreedyString &, const Node &, Session &s, FrameId) {
    return undeterminable(s, "a greedy string");
}

// values that touch no bytes

Result<Value> parse(const node::Computed &k, const Node &, Io &io, Session &s, FrameId frame) {
    return eval(k.value, s, frame, &io);
}

Result<size_t> build(const node::Computed &k, const Node &, const Value &, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto v = eval(k.value, s, frame, &io);
    if (!v)
        return std::unexpected(v.error());
    if (built)
        *built = std::move(*v);
    return 0;
}

Result<size_t> size_of(const node::Computed &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Pass &, const Node &, Io &, Session &, FrameId) {
    return Value();
}

Result<size_t> build(const node::Pass &, const Node &, const Value &, Io &, Session &, FrameId, Value *) {
    return 0;
}

Result<size_t> size_of(const node::Pass &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Terminator &, const Node &, Io &io, Session &s, FrameId) {
    if (!io.at_end())
        return fail(ErrorKind::StreamError, s.path, "expected end of stream");
    return Value();
}

Result<size_t> build(const node::Terminator &, const Node &, const Value &, Io &, Session &, FrameId, Value *) {
    return 0;
}

Result<size_t> size_of(const node::Terminator &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Tell &, const Node &, Io &io, Session &, FrameId) {
    return Value(io.offset());
}

Result<size_t> build(const node::Tell &, const Node &, const Value &, Io &io, Session &, FrameId, Value *built) {
    if (built)
        *built = Value(io.offset());
    return 0;
}

Result<size_t> size_of(const node::Tell &, const Node &, Session &, FrameId) {
    return 0;
}

Result<Value> parse(const node::Index &, const Node &, Io &, Session &s, FrameId frame) {
    auto idx = s.context(frame).index();
    if (!idx)
        return fail(ErrorKind::ArgumentError, s.path, "index used outside of a repetition");
    return Value(*idx);
}

Result<size_t> build(const node::Index &k, const Node &self, const Value &, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto v = parse(k, self, io, s, frame);
    if (!v)
        return std::unexpected(v.error());
    if (built)
        *built = std::move(*v);
    return 0;
}

Result<size_t> size_of(const node::Index &, const Node &, Session &, FrameId) {
    return 0;
}

// fixed content

Result<Value> parse(const node::Padding &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto n = eval_count(k.length, s, frame, &io);
    if (!n)
        return std::unexpected(n.error());
    auto data = io.read(*n, s.path);
    if (!data)
        return std::unexpected(data.error());
    if (k.strict && std::ranges::any_of(*data, [&k](uint8_t b) { return b != k.pattern; }))
        return fail(ErrorKind::CheckError, s.path, fmt::format("padding bytes differ from 0x{:02x}", k.pattern));
    return Value();
}

Result<size_t> build(const node::Padding &k, const Node &, const Value &, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto n = eval_count(k.length, s, frame, &io);
    if (!n)
        return std::unexpected(n.error());
    return io.write(Bytes(*n, k.pattern), s.path);
}

Result<size_t> size_of(const node::Padding &k, const Node &, Session &s, FrameId frame) {
    return eval_static_count(k.length, s, frame);
}

Result<Value> parse(const node::Const &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto v = parse(k.sub.node(), io, s, frame);
    if (!v)
        return v;
    if (!(*v == k.value))
        return fail(ErrorKind::CheckError, s.path, fmt::format("expected {} but parsed {}", k.value.dump(), v->dump()));
    return v;
}

Result<size_t> build(const node::Const &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    if (!value.is_none() && !(value == k.value))
        return fail(ErrorKind::CheckError, s.path, fmt::format("expected {} but given {}", k.value.dump(), value.dump()));
    if (built)
        *built = k.value;
    return build(k.sub.node(), k.value, io, s, frame);
}

Result<size_t> size_of(const node::Const &k, const Node &, Session &s, FrameId frame) {
    return size_of(k.sub.node(), s, frame);
}

Result<Value> parse(const node::Check &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto v = eval(k.predicate, s, frame, &io);
    if (!v)
        return v;
    if (!v->truthy())
        return fail(ErrorKind::CheckError, s.path, fmt::format("check failed: {}", k.predicate.str()));
    return Value();
}

Result<size_t> build(const node::Check &k, const Node &self, const Value &, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto v = parse(k, self, io, s, frame);
    if (!v)
        return std::unexpected(v.error());
    return 0;
}

Result<size_t> size_of(const node::Check &, const Node &, Session &, FrameId) {
    return 0;
}

// diagnostics

namespace {

void print_probe(const node::Probe &k, const Io &io, const Session &s, FrameId frame) {
    fmt::print(stderr, "[construe] probe {} at {} offset {}: {}\n", k.label.empty() ? "-" : k.label, s.path.str(),
               io.offset(), Value(s.arena.frame(frame).values).dump());
}

} // namespace

Result<Value> parse(const node::Probe &k, const Node &, Io &io, Session &s, FrameId frame) {
    print_probe(k, io, s, frame);
    return Value();
}

Result<size_t> build(const node::Probe &k, const Node &, const Value &, Io &io, Session &s, FrameId frame,
                     Value *) {
    print_probe(k, io, s, frame);
    return 0;
}

Result<size_t> size_of(const node::Probe &, const Node &, Session &, FrameId) {
    return 0;
}

// plugin leaves

Result<Value> parse(const node::Custom &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto v = k.codec->parse(io, s.context(frame, &io));
    if (!v)
        return std::unexpected(v.error().located(s.path));
    return v;
}

Result<size_t> build(const node::Custom &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *) {
    auto n = k.codec->build(value, io, s.context(frame, &io));
    if (!n)
        return std::unexpected(n.error().located(s.path));
    return n;
}

Result<size_t> size_of(const node::Custom &k, const Node &, Session &s, FrameId frame) {
    auto n = k.codec->size_of(s.context(frame));
    if (!n)
        return std::unexpected(n.error().located(s.path));
    return n;
}

} // namespace construe::engine
