#pragma once

#include "cst/stream.hpp"
#include "cst/utility.hpp"
#include "cst/value.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace construe {

struct Node;

/** @brief Options for a single parse, build or sizeof invocation. */
struct Config {
    bool trace = false; ///< Log every named field to stderr as it is parsed or built.
};

/**
 * @brief Immutable handle to a schema node.
 *
 * Copies share the node. A schema tree can be used from several threads at once
 * since every invocation carries its own context arena and path.
 */
class Construct {
public:
    explicit Construct(Node node);

    const Node &node() const {
        return *node_;
    }
    const std::string &name() const;
    bool is_embedded() const;
    bool is_optional() const;

    /** @brief Copy of this construct carrying @p name. */
    Construct named(std::string name) const;
    /** @brief Copy whose result entries are merged into the enclosing struct. */
    Construct embedded() const;
    /** @brief Copy that builds from none when its key is missing. */
    Construct optional() const;

    Result<Value> parse(std::span<const uint8_t> data, const Config &config = {}) const;
    Result<Value> parse(std::string_view data, const Config &config = {}) const;
    Result<Value> parse_stream(Stream &stream, const Container &context = {}, const Config &config = {}) const;

    Result<Bytes> build(const Value &value, const Config &config = {}) const;
    /** @return Number of bytes written to @p stream. */
    Result<size_t> build_stream(const Value &value, Stream &stream, const Container &context = {},
                                const Config &config = {}) const;

    /** @brief Static size, or SizeofError when it depends on data not known yet. */
    Result<size_t> size_of(const Container &context = {}) const;

private:
    explicit Construct(std::shared_ptr<const Node> node) : node_(std::move(node)) {
    }

    std::shared_ptr<const Node> node_;
};

} // namespace construe
