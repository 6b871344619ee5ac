#include "cst/context.hpp"

#include <fmt/format.h>

namespace construe {

namespace {

const Container &empty_container() {
    static const Container empty;
    return empty;
}

} // namespace

const Value *Context::find(std::string_view name) const {
    for (FrameId id = frame_; id != no_frame; id = arena_->frame(id).parent) {
        if (const Value *v = arena_->frame(id).values.find(name))
            return v;
    }
    return nullptr;
}

Result<Value> Context::get(std::string_view name) const {
    if (const Value *v = find(name))
        return *v;
    return fail(ErrorKind::MissingFieldError, *path_, fmt::format("no context entry named '{}'", name));
}

bool Context::contains(std::string_view name) const {
    return find(name) != nullptr;
}

const Container &Context::locals() const {
    if (frame_ == no_frame)
        return empty_container();
    return arena_->frame(frame_).values;
}

std::optional<Context> Context::parent() const {
    if (frame_ == no_frame || arena_->frame(frame_).parent == no_frame)
        return std::nullopt;
    return Context(*arena_, arena_->frame(frame_).parent, *path_, offset_);
}

std::optional<size_t> Context::index() const {
    for (FrameId id = frame_; id != no_frame; id = arena_->frame(id).parent) {
        if (auto idx = arena_->frame(id).index)
            return idx;
    }
    return std::nullopt;
}

} // namespace construe
