#pragma once

#include "cst/construct.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace construe {

/** @brief Options controlling how a schema is lowered. */
struct CompileOptions {
    bool verbose = false;     ///< Log every interpreted fallback and a summary to stderr.
    bool fuse_records = true; ///< Read and write structs of fixed width leaves in one operation.
    bool bulk_arrays = true;  ///< Read and write arrays of integers in one operation.
};

/** @brief A node the compiled program hands back to the interpreter, and why. */
struct Fallback {
    std::string path;
    std::string kind;
    std::string reason;
};

/**
 * @brief A schema lowered to a tree of specialised operations.
 *
 * Behaves exactly like the Construct it was compiled from: values, bytes,
 * error kinds, paths and messages are the same. Nodes the compiler cannot
 * lower run through the interpreter from inside the program.
 */
class CompiledProgram {
public:
    struct Op;

    Result<Value> parse(std::span<const uint8_t> data, const Config &config = {}) const;
    Result<Value> parse(std::string_view data, const Config &config = {}) const;
    Result<Value> parse_stream(Stream &stream, const Container &context = {}, const Config &config = {}) const;

    Result<Bytes> build(const Value &value, const Config &config = {}) const;
    Result<size_t> build_stream(const Value &value, Stream &stream, const Container &context = {},
                                const Config &config = {}) const;

    Result<size_t> size_of(const Container &context = {}) const;

    /** @brief Size known at compile time, when it does not depend on any data. */
    std::optional<size_t> static_size() const {
        return static_size_;
    }

    /** @brief Leaf encodings the program calls back into, by kind name. */
    const std::vector<std::string> &leaf_callbacks() const {
        return leaf_callbacks_;
    }
    const std::vector<Fallback> &fallbacks() const {
        return fallbacks_;
    }
    bool fully_compiled() const {
        return fallbacks_.empty();
    }

    /**
     * @brief Checks this program against the interpreter on @p sample.
     *
     * Parses the sample both ways, then builds the parsed value both ways, and
     * fails with CheckError on the first difference. Callers should run this on
     * representative data before trusting a compiled program.
     */
    Result<void> verify(const Construct &reference, std::span<const uint8_t> sample) const;

private:
    friend Result<CompiledProgram> compile(const Construct &construct, const CompileOptions &options);

    explicit CompiledProgram(Construct source) : source_(std::move(source)) {
    }

    Construct source_;
    std::shared_ptr<const Op> root_;
    std::optional<size_t> static_size_;
    std::vector<std::string> leaf_callbacks_;
    std::vector<Fallback> fallbacks_;
};

/**
 * @brief Lowers @p construct into a CompiledProgram.
 *
 * Never rejects a schema for being hard to compile; ineligible nodes fall back
 * to interpretation. Fails with ReferenceError only when a reference cannot be
 * resolved at all.
 */
Result<CompiledProgram> compile(const Construct &construct, const CompileOptions &options = {});

} // namespace construe
