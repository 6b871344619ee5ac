#include "cst/stream.hpp"

#include <algorithm>
#include <cstring>

namespace construe {

size_t BufferStream::read(std::span<uint8_t> buffer) {
    size_t n = pos_ < data_.size() ? std::min(buffer.size(), data_.size() - pos_) : 0;
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

size_t BufferStream::write(std::span<const uint8_t> data) {
    if (pos_ + data.size() > data_.size()) {
        data_.resize(pos_ + data.size());
    }
    std::ranges::copy(data, data_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ += data.size();
    return data.size();
}

bool BufferStream::seek(size_t position) {
    // Seeking past the end is allowed, the gap is zero filled by the next write.
    pos_ = position;
    return true;
}

size_t SpanStream::read(std::span<uint8_t> buffer) {
    size_t n = pos_ < data_.size() ? std::min(buffer.size(), data_.size() - pos_) : 0;
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

bool SpanStream::seek(size_t position) {
    if (position > data_.size())
        return false;
    pos_ = position;
    return true;
}

} // namespace construe
