#pragma once

#include "cst/stream.hpp"
#include "cst/utility.hpp"

#include <filesystem>
#include <memory>
#include <span>

namespace construe {

class MappedFile;

/**
 * @brief Maps @p path read-only.
 * @return The mapping, or a StreamError naming the failed step and the system error.
 */
Result<std::shared_ptr<const MappedFile>> map_file(const std::filesystem::path &path);

/**
 * @brief Read-only view of a file mapped into memory.
 *
 * Backs MappedFileStream so large captures can be parsed without copying.
 * The mapping is released when the last owner lets go of it. An empty file
 * maps to an empty span.
 */
class MappedFile {
public:
    ~MappedFile();

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    std::span<const uint8_t> bytes() const {
        return {data_, size_};
    }

private:
    friend Result<std::shared_ptr<const MappedFile>> map_file(const std::filesystem::path &path);

    MappedFile(const uint8_t *data, size_t size) : data_(data), size_(size) {
    }

    const uint8_t *data_;
    size_t size_;
};

/** @brief Seekable read-only stream over a mapped file. */
class MappedFileStream final : public Stream {
public:
    explicit MappedFileStream(std::shared_ptr<const MappedFile> file) : file_(std::move(file)) {
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
    std::shared_ptr<const MappedFile> file_;
    size_t pos_ = 0;
};

} // namespace construe
