#pragma once

#include "cst/construct.hpp"

#include <mutex>
#include <optional>

namespace construe {

/**
 * @brief A field captured on parse and decoded only when asked for.
 *
 * Holds the raw bytes of the field and a snapshot of the context it could see.
 * The first call to value() parses them and later calls return the same
 * result. Errors from that parse are located relative to the field itself.
 */
class Deferred {
public:
    Deferred(Construct sub, Bytes data, Container context, Config config)
        : sub_(std::move(sub)), data_(std::move(data)), context_(std::move(context)), config_(config) {
    }

    Deferred(const Deferred &) = delete;
    Deferred &operator=(const Deferred &) = delete;

    const Bytes &data() const {
        return data_;
    }

    /** @brief True once value() has run. */
    bool demanded() const;

    Result<Value> value() const;

private:
    Construct sub_;
    Bytes data_;
    Container context_;
    Config config_;

    mutable std::mutex mutex_;
    mutable std::optional<Result<Value>> cached_;
};

/** @brief Parses @p value if it is deferred, otherwise returns it unchanged. */
Result<Value> demand(const Value &value);

} // namespace construe
