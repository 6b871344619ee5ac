#pragma once

// Per-kind implementations of the interpreter, one overload set per node payload.
// engine::parse/build/size_of in construct.cpp dispatch to these.

#include "cst/engine.hpp"

namespace construe::engine {

// leaf.cpp
Result<Value> parse(const node::BytesField &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::BytesField &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::BytesField &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::GreedyBytes &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::GreedyBytes &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::GreedyBytes &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Integer &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Integer &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Integer &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Float &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Float &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Float &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Flag &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Flag &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Flag &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::VarInt &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::VarInt &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::VarInt &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::PaddedString &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::PaddedString &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::PaddedString &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::CString &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::CString &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::CString &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::GreedyString &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::GreedyString &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::GreedyString &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Computed &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Computed &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Computed &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Pass &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Pass &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Pass &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Terminator &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Terminator &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Terminator &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Tell &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Tell &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Tell &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Index &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Index &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Index &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Padding &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Padding &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Padding &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Const &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Const &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Const &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Check &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Check &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Check &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Probe &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Probe &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Probe &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Custom &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Custom &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Custom &k, const Node &self, Session &s, FrameId frame);

// structs.cpp
Result<Value> parse(const node::Struct &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Struct &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Struct &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Sequence &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Sequence &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Sequence &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Union &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Union &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Union &k, const Node &self, Session &s, FrameId frame);

// repeat.cpp
Result<Value> parse(const node::Array &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Array &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Array &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Range &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Range &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Range &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::RepeatUntil &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::RepeatUntil &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::RepeatUntil &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::PrefixedArray &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::PrefixedArray &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::PrefixedArray &k, const Node &self, Session &s, FrameId frame);

// bits.cpp
Result<Value> parse(const node::Bitwise &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Bitwise &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Bitwise &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::BitsInteger &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::BitsInteger &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::BitsInteger &k, const Node &self, Session &s, FrameId frame);

// deferred.cpp
Result<Value> parse(const node::OnDemand &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::OnDemand &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::OnDemand &k, const Node &self, Session &s, FrameId frame);

// conditional.cpp
Result<Value> parse(const node::Switch &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Switch &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Switch &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::IfThenElse &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::IfThenElse &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::IfThenElse &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Select &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Select &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Select &k, const Node &self, Session &s, FrameId frame);

// transform.cpp
Result<Value> parse(const node::Peek &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Peek &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Peek &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Pointer &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Pointer &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Pointer &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Aligned &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Aligned &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Aligned &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Padded &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Padded &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Padded &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Transformed &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Transformed &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Transformed &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::RestreamData &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::RestreamData &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::RestreamData &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Prefixed &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Prefixed &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Prefixed &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::RawCopy &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::RawCopy &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::RawCopy &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Checksum &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Checksum &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Checksum &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::NamedTuple &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::NamedTuple &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::NamedTuple &k, const Node &self, Session &s, FrameId frame);

// adapter.cpp
Result<Value> parse(const node::Adapter &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Adapter &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Adapter &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::ExprAdapter &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::ExprAdapter &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::ExprAdapter &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Rebuild &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Rebuild &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Rebuild &k, const Node &self, Session &s, FrameId frame);

Result<Value> parse(const node::Default &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Default &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Default &k, const Node &self, Session &s, FrameId frame);

// registry.cpp
Result<Value> parse(const node::Reference &k, const Node &self, Io &io, Session &s, FrameId frame);
Result<size_t> build(const node::Reference &k, const Node &self, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built);
Result<size_t> size_of(const node::Reference &k, const Node &self, Session &s, FrameId frame);

/** @brief Target of a reference, or ReferenceError. */
Result<Construct> resolve(const node::Reference &ref, const Path &path);

/** @brief Case chosen by the switch key: a case, the default, or SwitchError. */
Result<const Construct *> select_case(const node::Switch &k, Session &s, FrameId frame, const Io *io);

/** @brief Branch chosen by the predicate. */
Result<const Construct *> select_branch(const node::IfThenElse &k, Session &s, FrameId frame, const Io *io);

/** @brief Parses @p node from an in-memory window, sharing the session and frame. */
Result<Value> parse_window(const Node &node, std::span<const uint8_t> data, Session &s, FrameId frame);

/** @brief Builds @p node into a fresh buffer, sharing the session and frame. */
Result<Bytes> build_window(const Node &node, const Value &value, Session &s, FrameId frame, Value *built);

} // namespace construe::engine
