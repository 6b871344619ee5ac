#include "codecs.hpp"

#include <fmt/format.h>

namespace construe::engine {

namespace {

/** @brief Hands out the bits of the bytes read from an Io, one byte per bit, most significant first. */
class BitReader final : public Stream {
public:
    explicit BitReader(Io &io) : io_(io) {
    }

    size_t read(std::span<uint8_t> buffer) override {
        size_t n = 0;
        while (n < buffer.size()) {
            if (left_ == 0) {
                Bytes next = io_.read_up_to(1);
                if (next.empty())
                    break;
                byte_ = next[0];
                left_ = 8;
            }
            --left_;
            buffer[n++] = (byte_ >> left_) & 1;
        }
        return n;
    }
    size_t write(std::span<const uint8_t>) override {
        return 0;
    }

private:
    Io &io_;
    uint8_t byte_ = 0;
    unsigned left_ = 0;
};

Result<size_t> whole_bytes(size_t bits, const Path &path, std::string_view action) {
    if (bits % 8 != 0)
        return fail(ErrorKind::FormatFieldError, path,
                    fmt::format("bitwise content {} {} bits, not a whole number of bytes", action, bits));
    return bits / 8;
}

} // namespace

Result<Value> parse(const node::Bitwise &k, const Node &, Io &io, Session &s, FrameId frame) {
    size_t mark = io.mark();
    BitReader reader(io);
    Io bits(reader);
    auto v = parse(k.sub.node(), bits, s, frame);
    // The reader may have pulled a byte ahead, so re-read exactly what the bits cover.
    io.rollback(mark);
    if (!v)
        return v;
    auto n = whole_bytes(bits.offset(), s.path, "used");
    if (!n)
        return std::unexpected(n.error());
    if (auto consumed = io.read(*n, s.path); !consumed)
        return std::unexpected(consumed.error());
    return v;
}

Result<size_t> build(const node::Bitwise &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto bits = build_window(k.sub.node(), value, s, frame, built);
    if (!bits)
        return std::unexpected(bits.error());
    auto n = whole_bytes(bits->size(), s.path, "built");
    if (!n)
        return std::unexpected(n.error());

    Bytes packed(*n, 0);
    for (size_t i = 0; i < bits->size(); ++i) {
        if ((*bits)[i] != 0)
            packed[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
    }
    return io.write(packed, s.path);
}

Result<size_t> size_of(const node::Bitwise &k, const Node &, Session &s, FrameId frame) {
    auto bits = size_of(k.sub.node(), s, frame);
    if (!bits)
        return bits;
    if (*bits % 8 != 0)
        return fail(ErrorKind::SizeofError, s.path, fmt::format("bitwise content of {} bits is not whole bytes", *bits));
    return *bits / 8;
}

Result<Value> parse(const node::BitsInteger &k, const Node &, Io &io, Session &s, FrameId) {
    auto data = io.read(k.bits, s.path);
    if (!data)
        return std::unexpected(data.error());
    uint64_t raw = 0;
    for (uint8_t bit : *data) {
        raw = (raw << 1) | (bit != 0);
    }
    if (k.is_signed) {
        if (k.bits < 64 && (raw >> (k.bits - 1)) & 1)
            raw |= ~uint64_t{0} << k.bits;
        return Value(static_cast<int64_t>(raw));
    }
    if (raw > static_cast<uint64_t>(INT64_MAX))
        return fail(ErrorKind::IntegerError, s.path, fmt::format("unsigned value {} exceeds the integer range", raw));
    return Value(static_cast<int64_t>(raw));
}

Result<size_t> build(const node::BitsInteger &k, const Node &, const Value &value, Io &io, Session &s, FrameId,
                     Value *) {
    const auto *n = value.get<int64_t>();
    if (!n)
        return fail(ErrorKind::FormatFieldError, s.path, fmt::format("expected an integer, got {}", value.type_name()));

    bool in_range;
    if (k.is_signed) {
        in_range = k.bits == 64 || (*n >= -(int64_t{1} << (k.bits - 1)) && *n < (int64_t{1} << (k.bits - 1)));
    } else {
        in_range = *n >= 0 && (k.bits >= 63 || *n < (int64_t{1} << k.bits));
    }
    if (!in_range)
        return fail(ErrorKind::IntegerError, s.path,
                    fmt::format("{} out of range for {} {}-bit integer", *n, k.is_signed ? "signed" : "unsigned", k.bits));

    auto raw = static_cast<uint64_t>(*n);
    Bytes data(k.bits);
    for (unsigned i = 0; i < k.bits; ++i) {
        data[k.bits - 1 - i] = static_cast<uint8_t>((raw >> i) & 1);
    }
    return io.write(data, s.path);
}

Result<size_t> size_of(const node::BitsInteger &k, const Node &, Session &, FrameId) {
    return k.bits;
}

} // namespace construe::engine
