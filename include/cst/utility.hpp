#pragma once

#include "cst/error.hpp"

#include <expected>
#include <string>
#include <utility>

namespace construe {

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, const Path &path, std::string message) {
    return std::unexpected(Error(kind, path, std::move(message)));
}

} // namespace construe
