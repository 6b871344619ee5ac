#pragma once

#include "cst/utility.hpp"
#include "cst/value.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace construe {

using FrameId = size_t;
inline constexpr FrameId no_frame = static_cast<FrameId>(-1);

/**
 * @brief Storage for the context frames of one invocation.
 *
 * Frames live in a vector and refer to their parent by index, so handles stay
 * valid while the vector grows. Frames are pushed and truncated in stack order.
 */
class ContextArena {
public:
    /** @brief One nesting level of context. */
    struct Frame {
        Container values;
        FrameId parent = no_frame;
        std::optional<size_t> index; ///< Repetition index while a repeat runs in this frame.
    };

    FrameId push(FrameId parent) {
        FrameId id = frames_.size();
        frames_.push_back({{}, parent, std::nullopt});
        return id;
    }

    /** @brief Discards every frame created at or after @p id. */
    void truncate(FrameId id) {
        if (id < frames_.size())
            frames_.resize(id);
    }

    Frame &frame(FrameId id) {
        return frames_[id];
    }
    const Frame &frame(FrameId id) const {
        return frames_[id];
    }
    size_t size() const {
        return frames_.size();
    }

private:
    std::vector<Frame> frames_;
};

/**
 * @brief Read-only view of the context handed to callbacks and expressions.
 *
 * Lookups walk the parent chain, nearest frame first. The view borrows the
 * arena and path of the running invocation and must not outlive the call.
 */
class Context {
public:
    Context(const ContextArena &arena, FrameId frame, const Path &path, std::optional<size_t> offset = std::nullopt)
        : arena_(&arena), frame_(frame), path_(&path), offset_(offset) {
    }

    /** @brief Looks @p name up in this frame and then its ancestors. */
    Result<Value> get(std::string_view name) const;
    bool contains(std::string_view name) const;

    /** @brief Entries of the current frame only. */
    const Container &locals() const;

    /** @brief View starting one frame up, if there is one. */
    std::optional<Context> parent() const;

    /** @brief Nearest enclosing repetition index. */
    std::optional<size_t> index() const;

    /** @brief Bytes consumed or produced so far, by the engine's own count. */
    std::optional<size_t> offset() const {
        return offset_;
    }

    const Path &path() const {
        return *path_;
    }
    FrameId frame() const {
        return frame_;
    }

private:
    const Value *find(std::string_view name) const;

    const ContextArena *arena_;
    FrameId frame_;
    const Path *path_;
    std::optional<size_t> offset_;
};

} // namespace construe
