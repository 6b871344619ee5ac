#include "cst/io.hpp"

#include <algorithm>

namespace construe {

size_t Io::pull(uint8_t *out, size_t n) {
    size_t got = 0;
    while (got < n && !pending_.empty()) {
        out[got++] = pending_.front();
        pending_.pop_front();
    }
    while (got < n) {
        size_t r = stream_.read({out + got, n - got});
        if (r == 0)
            break;
        got += r;
    }
    if (!journals_.empty())
        journals_.back().insert(journals_.back().end(), out, out + got);
    offset_ += got;
    return got;
}

Result<Bytes> Io::read(size_t n, const Path &path) {
    Bytes out = read_up_to(n);
    if (out.size() < n)
        return fail(ErrorKind::StreamError, path, fmt::format("expected {} bytes, found {}", n, out.size()));
    return out;
}

Bytes Io::read_up_to(size_t n) {
    // Grow in chunks so a hostile length cannot force a huge allocation up front.
    constexpr size_t chunk = 64 * 1024;
    Bytes out;
    while (out.size() < n) {
        size_t want = std::min(chunk, n - out.size());
        size_t before = out.size();
        out.resize(before + want);
        size_t got = pull(out.data() + before, want);
        out.resize(before + got);
        if (got < want)
            break;
    }
    return out;
}

Bytes Io::read_all() {
    constexpr size_t chunk = 64 * 1024;
    Bytes out;
    while (true) {
        size_t before = out.size();
        out.resize(before + chunk);
        size_t got = pull(out.data() + before, chunk);
        out.resize(before + got);
        if (got < chunk)
            break;
    }
    return out;
}

Result<size_t> Io::write(std::span<const uint8_t> data, const Path &path) {
    size_t written = write_up_to(data);
    if (written != data.size())
        return fail(ErrorKind::StreamError, path, fmt::format("wrote {} of {} bytes", written, data.size()));
    return written;
}

size_t Io::write_up_to(std::span<const uint8_t> data) {
    size_t written = data.empty() ? 0 : stream_.write(data);
    offset_ += written;
    return written;
}

bool Io::at_end() {
    if (!pending_.empty())
        return false;
    uint8_t probe;
    if (stream_.read({&probe, 1}) == 0)
        return true;
    pending_.push_back(probe);
    return false;
}

size_t Io::mark() {
    journals_.emplace_back();
    return journals_.size();
}

void Io::commit(size_t mark) {
    while (journals_.size() >= mark && !journals_.empty()) {
        Bytes done = std::move(journals_.back());
        journals_.pop_back();
        if (!journals_.empty())
            journals_.back().insert(journals_.back().end(), done.begin(), done.end());
    }
}

void Io::rollback(size_t mark) {
    Bytes replay;
    while (journals_.size() >= mark && !journals_.empty()) {
        Bytes undone = std::move(journals_.back());
        journals_.pop_back();
        undone.insert(undone.end(), replay.begin(), replay.end());
        replay = std::move(undone);
    }
    pending_.insert(pending_.begin(), replay.begin(), replay.end());
    offset_ -= replay.size();
}

} // namespace construe
