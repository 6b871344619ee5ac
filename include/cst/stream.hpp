#pragma once

#include "cst/value.hpp"

#include <cstddef>
#include <optional>
#include <span>

namespace construe {

/**
 * @brief Byte source or sink consumed by the engine.
 *
 * Only `read` and `write` are required. Seeking is an optional capability and
 * no core construct depends on it except those that explicitly jump (pointer).
 */
class Stream {
public:
    virtual ~Stream() = default;

    /** @brief Reads up to `buffer.size()` bytes. Returns the count actually read. */
    virtual size_t read(std::span<uint8_t> buffer) = 0;

    /** @brief Writes @p data. Returns the count actually written. */
    virtual size_t write(std::span<const uint8_t> data) = 0;

    virtual bool seekable() const {
        return false;
    }
    virtual std::optional<size_t> tell() const {
        return std::nullopt;
    }
    virtual bool seek(size_t position) {
        (void)position;
        return false;
    }
};

/** @brief Owning, growable, seekable in-memory stream. */
class BufferStream final : public Stream {
public:
    BufferStream() = default;
    explicit BufferStream(Bytes data) : data_(std::move(data)) {
    }

    size_t read(std::span<uint8_t> buffer) override;
    size_t write(std::span<const uint8_t> data) override;

    bool seekable() const override {
        return true;
    }
    std::optional<size_t> tell() const override {
        return pos_;
    }
    bool seek(size_t position) override;

    const Bytes &data() const {
        return data_;
    }
    Bytes take() {
        pos_ = 0;
        return std::move(data_);
    }

private:
    Bytes data_;
    size_t pos_ = 0;
};

/** @brief Non-owning read-only view over caller memory. */
class SpanStream final : public Stream {
public:
    explicit SpanStream(std::span<const uint8_t> data) : data_(data) {
    }

    size_t read(std::span<uint8_t> buffer) override;
    size_t write(std::span<const uint8_t>) override {
        return 0;
    }

    bool seekable() const override {
        return true;
    }
    std::optional<size_t> tell() const override {
        return pos_;
    }
    bool seek(size_t position) override;

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

/** @brief Forwards reads and writes to another stream while hiding its seek capability. */
class ForwardStream final : public Stream {
public:
    explicit ForwardStream(Stream &inner) : inner_(inner) {
    }

    size_t read(std::span<uint8_t> buffer) override {
        return inner_.read(buffer);
    }
    size_t write(std::span<const uint8_t> data) override {
        return inner_.write(data);
    }

private:
    Stream &inner_;
};

} // namespace construe
