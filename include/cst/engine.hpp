#pragma once

#include "cst/construct.hpp"
#include "cst/context.hpp"
#include "cst/io.hpp"
#include "cst/node.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace construe {

/** @brief State owned by one parse, build or sizeof invocation. */
struct Session {
    explicit Session(const Config &config = {}) : config(config) {
    }

    Context context(FrameId frame, const Io *io = nullptr) const {
        return Context(arena, frame, path, io ? std::optional<size_t>(io->offset()) : std::nullopt);
    }

    ContextArena arena;
    Path path;
    Config config;
    std::vector<std::string> sizing; ///< References currently being sized, to stop unbounded recursion.
};

/** @brief Extends the session path for the lifetime of the scope. Empty names add nothing. */
class PathScope {
public:
    PathScope(Path &path, const std::string &name) : path_(path), pushed_(!name.empty()) {
        if (pushed_)
            path_.push(name);
    }
    PathScope(Path &path, size_t index) : path_(path), pushed_(true) {
        path_.push(index);
    }
    ~PathScope() {
        if (pushed_)
            path_.pop();
    }

    PathScope(const PathScope &) = delete;
    PathScope &operator=(const PathScope &) = delete;

private:
    Path &path_;
    bool pushed_;
};

/** @brief Pushes a child frame and discards it, and anything above it, on exit. */
class FrameScope {
public:
    FrameScope(ContextArena &arena, FrameId parent) : arena_(arena), id_(arena.push(parent)) {
    }
    ~FrameScope() {
        arena_.truncate(id_);
    }

    FrameScope(const FrameScope &) = delete;
    FrameScope &operator=(const FrameScope &) = delete;

    FrameId id() const {
        return id_;
    }

private:
    ContextArena &arena_;
    FrameId id_;
};

/** @brief Publishes the repetition index on a frame and restores the previous one on exit. */
class IndexScope {
public:
    IndexScope(ContextArena &arena, FrameId frame) : arena_(arena), frame_(frame), saved_(arena.frame(frame).index) {
    }
    ~IndexScope() {
        arena_.frame(frame_).index = saved_;
    }

    IndexScope(const IndexScope &) = delete;
    IndexScope &operator=(const IndexScope &) = delete;

    void set(size_t index) {
        arena_.frame(frame_).index = index;
    }

private:
    ContextArena &arena_;
    FrameId frame_;
    std::optional<size_t> saved_;
};

/**
 * The interpreter. Every node kind implements these three operations; the
 * compiler calls back into them for anything it does not lower itself.
 */
namespace engine {

Result<Value> parse(const Node &node, Io &io, Session &s, FrameId frame);

/**
 * @param built Receives the value actually built when it differs from @p value
 *              (computed, rebuilt, defaulted...). May be null.
 * @return Bytes written.
 */
Result<size_t> build(const Node &node, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built = nullptr);

Result<size_t> size_of(const Node &node, Session &s, FrameId frame);

/** @brief Parses an embedded node, merging its entries into @p into and the frame. */
Result<void> parse_embedded(const Node &node, Io &io, Session &s, FrameId frame, Container &into);

/** @brief Names a struct has already built, so embedded fields cannot claim them twice. */
using Names = std::unordered_set<std::string>;

/** @brief Builds an embedded node from the entries of the enclosing value. */
Result<size_t> build_embedded(const Node &node, const Container &from, Io &io, Session &s, FrameId frame,
                              Names &built);

Result<size_t> size_of_embedded(const Node &node, Session &s, FrameId frame);

/** @brief Records a named result in both the struct result and the frame. Fails on collision. */
Result<void> store(Session &s, FrameId frame, Container &into, const std::string &name, Value value);

/** @brief Marks @p name as built. Fails with OverwriteError if it already was. */
Result<void> claim(Names &built, const std::string &name, const Path &path);

/** @brief Value a struct hands to @p field on build: the supplied entry, none, or MissingFieldError. */
Result<Value> field_input(const Node &field, const Container &from, const Path &path);

/** @brief The container a struct builds from. None reads as @p empty. */
Result<const Container *> container_input(const Value &value, const Container &empty, const Path &path);

/** @brief The list a repetition builds from. */
Result<const List *> list_input(const Value &value, const Path &path);

Result<Value> eval(const Expr &expr, Session &s, FrameId frame, const Io *io, const Value *obj = nullptr);

/** @brief Evaluates a count or length: a non-negative integer, else ArgumentError. */
Result<size_t> eval_count(const Expr &expr, Session &s, FrameId frame, const Io *io);

/** @brief Like eval_count, but any failure becomes SizeofError. */
Result<size_t> eval_static_count(const Expr &expr, Session &s, FrameId frame);

Result<Value> decode_integer(std::span<const uint8_t> data, bool is_signed, Endian endian, const Path &path);
Result<Bytes> encode_integer(const Value &value, unsigned width, bool is_signed, Endian endian, const Path &path);

/** @brief Logs a named field when tracing is enabled. */
void trace(const Session &s, std::string_view action, const Value &value);

} // namespace engine

} // namespace construe
