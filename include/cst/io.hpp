#pragma once

#include "cst/stream.hpp"
#include "cst/utility.hpp"

#include <deque>
#include <fmt/format.h>
#include <span>
#include <utility>
#include <vector>

namespace construe {

/**
 * @brief The engine's byte accountant over a Stream.
 *
 * Io counts every byte it hands out or writes, so no construct needs tell().
 * Reads can be journaled with mark() and later pushed back in front of the
 * stream with rollback(), which gives attempt-and-discard semantics on streams
 * that cannot seek.
 */
class Io {
public:
    explicit Io(Stream &stream) : stream_(stream) {
    }

    Io(const Io &) = delete;
    Io &operator=(const Io &) = delete;

    /** @brief Reads exactly @p n bytes or fails with StreamError at @p path. */
    Result<Bytes> read(size_t n, const Path &path);
    /** @brief Reads at most @p n bytes. Fewer are returned only at end of stream. */
    Bytes read_up_to(size_t n);
    Bytes read_all();

    /** @brief Writes all of @p data or fails with StreamError at @p path. */
    Result<size_t> write(std::span<const uint8_t> data, const Path &path);
    /** @brief Writes as much of @p data as the stream takes. */
    size_t write_up_to(std::span<const uint8_t> data);

    /** @brief True when no byte is left. Peeks one byte without consuming it. */
    bool at_end();

    size_t offset() const {
        return offset_;
    }
    Stream &stream() {
        return stream_;
    }

    /** @brief Starts journaling reads. Returns the mark to commit or roll back. */
    size_t mark();
    /** @brief Keeps the reads made since @p mark. */
    void commit(size_t mark);
    /** @brief Un-reads everything read since @p mark. */
    void rollback(size_t mark);
    /** @brief Bytes read since @p mark, which must still be open. */
    const Bytes &recorded(size_t mark) const {
        return journals_[mark - 1];
    }

    /**
     * @brief Runs @p body with the stream positioned at @p position, then returns.
     *
     * Requires a seekable stream. Pending pushback and journals are set aside
     * for the duration, and the engine offset reads as @p position inside.
     */
    template <typename F>
    auto detour(size_t position, const Path &path, F &&body) -> decltype(body());

private:
    size_t pull(uint8_t *out, size_t n);

    Stream &stream_;
    std::deque<uint8_t> pending_;
    std::vector<Bytes> journals_;
    size_t offset_ = 0;
};

template <typename F>
auto Io::detour(size_t position, const Path &path, F &&body) -> decltype(body()) {
    std::optional<size_t> here = stream_.seekable() ? stream_.tell() : std::nullopt;
    if (!here)
        return fail(ErrorKind::StreamError, path, "stream is not seekable");
    // Bytes already pulled into pushback are physically behind the stream cursor.
    size_t physical = *here;

    if (!stream_.seek(position))
        return fail(ErrorKind::StreamError, path, fmt::format("cannot seek to offset {}", position));

    auto saved_pending = std::exchange(pending_, {});
    auto saved_journals = std::exchange(journals_, {});
    size_t saved_offset = std::exchange(offset_, position);

    auto result = body();

    pending_ = std::move(saved_pending);
    journals_ = std::move(saved_journals);
    offset_ = saved_offset;
    if (!stream_.seek(physical))
        return fail(ErrorKind::StreamError, path, fmt::format("cannot seek back to offset {}", physical));
    return result;
}

} // namespace construe
