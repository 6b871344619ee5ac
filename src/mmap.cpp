#include "cst/mmap.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <string_view>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace construe {

namespace {

/** @brief Closes a descriptor on every exit path; the mapping outlives it. */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {
    }
    ~FileDescriptor() {
        if (fd_ != -1)
            ::close(fd_);
    }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const {
        return fd_;
    }

private:
    int fd_;
};

std::unexpected<Error> system_error(std::string_view step, const std::filesystem::path &path) {
    return fail(ErrorKind::StreamError, {}, fmt::format("cannot {} {}: {}", step, path.string(), std::strerror(errno)));
}

} // namespace

Result<std::shared_ptr<const MappedFile>> map_file(const std::filesystem::path &path) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() == -1)
        return system_error("open", path);

    struct stat sb;
    if (::fstat(fd.get(), &sb) == -1)
        return system_error("stat", path);
    if (!S_ISREG(sb.st_mode))
        return fail(ErrorKind::StreamError, {}, fmt::format("cannot map {}: not a regular file", path.string()));

    auto size = static_cast<size_t>(sb.st_size);
    if (size == 0)
        return std::shared_ptr<const MappedFile>(new MappedFile(nullptr, 0));

    void *addr = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd.get(), 0);
    if (addr == MAP_FAILED)
        return system_error("map", path);
    // Schemas read front to back.
    ::madvise(addr, size, MADV_SEQUENTIAL);
    return std::shared_ptr<const MappedFile>(new MappedFile(static_cast<const uint8_t *>(addr), size));
}

MappedFile::~MappedFile() {
    if (data_)
        ::munmap(const_cast<uint8_t *>(data_), size_);
}

size_t MappedFileStream::read(std::span<uint8_t> buffer) {
    auto data = file_->bytes();
    size_t n = pos_ < data.size() ? std::min(buffer.size(), data.size() - pos_) : 0;
    if (n > 0) {
        std::memcpy(buffer.data(), data.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

bool MappedFileStream::seek(size_t position) {
    if (position > file_->bytes().size())
        return false;
    pos_ = position;
    return true;
}

} // namespace construe
