#include "cst/error.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace construe {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::StreamError:
        return "StreamError";
    case ErrorKind::FormatFieldError:
        return "FormatFieldError";
    case ErrorKind::StringError:
        return "StringError";
    case ErrorKind::IntegerError:
        return "IntegerError";
    case ErrorKind::RepeatError:
        return "RepeatError";
    case ErrorKind::IndexFieldError:
        return "IndexFieldError";
    case ErrorKind::CheckError:
        return "CheckError";
    case ErrorKind::NamedTupleError:
        return "NamedTupleError";
    case ErrorKind::RawCopyError:
        return "RawCopyError";
    case ErrorKind::MissingFieldError:
        return "MissingFieldError";
    case ErrorKind::SizeofError:
        return "SizeofError";
    case ErrorKind::SwitchError:
        return "SwitchError";
    case ErrorKind::OverwriteError:
        return "OverwriteError";
    case ErrorKind::ArgumentError:
        return "ArgumentError";
    case ErrorKind::ReferenceError:
        return "ReferenceError";
    }
    return "UnknownError";
}

std::string Path::str() const {
    if (segments_.empty())
        return "(root)";

    std::string out;
    for (const auto &segment : segments_) {
        if (const auto *name = std::get_if<std::string>(&segment)) {
            if (!out.empty())
                out += '.';
            out += *name;
        } else {
            out += fmt::format("[{}]", std::get<size_t>(segment));
        }
    }
    return out;
}

bool Error::is(ErrorKind kind) const {
    return kind_ == kind || std::ranges::find(wrappers_, kind) != wrappers_.end();
}

Error Error::wrapped(ErrorKind via) const {
    Error copy = *this;
    copy.wrappers_.push_back(via);
    return copy;
}

Error Error::located(const Path &path) const {
    if (!path_.empty())
        return *this;
    Error copy = *this;
    copy.path_ = path;
    return copy;
}

std::string Error::what() const {
    std::string out = fmt::format("{} at {}: {}", to_string(kind_), path_.str(), message_);
    for (ErrorKind via : wrappers_) {
        out += fmt::format(" (via {})", to_string(via));
    }
    return out;
}

} // namespace construe
