#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace construe {

/** @brief The closed set of failure kinds raised by the engine. */
enum class ErrorKind : uint8_t {
    StreamError,
    FormatFieldError,
    StringError,
    IntegerError,
    RepeatError,
    IndexFieldError,
    CheckError,
    NamedTupleError,
    RawCopyError,
    MissingFieldError,
    SizeofError,
    SwitchError,
    OverwriteError,
    ArgumentError,
    ReferenceError,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief Location of a construct inside a schema tree.
 *
 * A path is a list of segments, each either a field name or a repetition index.
 * It renders as `header.items[2].value`.
 */
class Path {
public:
    using Segment = std::variant<std::string, size_t>;

    Path() = default;
    Path(std::initializer_list<Segment> segments) : segments_(segments) {
    }

    void push(std::string name) {
        segments_.emplace_back(std::move(name));
    }
    void push(size_t index) {
        segments_.emplace_back(index);
    }
    void pop() {
        segments_.pop_back();
    }

    bool empty() const {
        return segments_.empty();
    }
    size_t depth() const {
        return segments_.size();
    }
    const std::vector<Segment> &segments() const {
        return segments_;
    }

    std::string str() const;

    bool operator==(const Path &) const = default;

private:
    std::vector<Segment> segments_;
};

/**
 * @brief A typed, positioned failure.
 *
 * The original kind is never replaced. Frames the error passes through may
 * append wrapper kinds (e.g. IndexFieldError), and `is()` matches both.
 */
class Error {
public:
    Error(ErrorKind kind, Path path, std::string message)
        : kind_(kind), path_(std::move(path)), message_(std::move(message)) {
    }

    ErrorKind kind() const {
        return kind_;
    }
    const Path &path() const {
        return path_;
    }
    const std::string &message() const {
        return message_;
    }
    const std::vector<ErrorKind> &wrappers() const {
        return wrappers_;
    }

    bool is(ErrorKind kind) const;

    /** @brief Returns a copy carrying an additional wrapper kind. */
    Error wrapped(ErrorKind via) const;

    /** @brief Returns a copy located at @p path if this error has no path yet. */
    Error located(const Path &path) const;

    /** @brief Human readable rendering: kind, path, message and wrappers. */
    std::string what() const;

private:
    ErrorKind kind_;
    Path path_;
    std::string message_;
    std::vector<ErrorKind> wrappers_;
};

} // namespace construe
