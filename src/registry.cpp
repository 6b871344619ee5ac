#include "cst/registry.hpp"

#include "codecs.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <functional>
#include <unordered_set>

namespace construe {

namespace {

/** Calls @p visit for every reference inside @p c, without following any of them. */
void for_each_reference(const Construct &c, const std::function<void(const node::Reference &)> &visit) {
    if (const auto *ref = std::get_if<node::Reference>(&c.node().kind)) {
        visit(*ref);
        return;
    }
    for (const auto &child : children(c.node())) {
        for_each_reference(child, visit);
    }
}

} // namespace

Result<void> Registry::define(const std::string &name, Construct construct) {
    if (name.empty())
        return fail(ErrorKind::ReferenceError, {}, "definition needs a name");
    if (!table_->definitions.try_emplace(name, std::move(construct)).second)
        return fail(ErrorKind::ReferenceError, {}, fmt::format("duplicate definition '{}'", name));
    return {};
}

Construct Registry::ref(const std::string &name) const {
    return Construct(Node{node::Reference{table_, name}, {}});
}

std::optional<Construct> Registry::lookup(std::string_view name) const {
    if (auto it = table_->definitions.find(std::string(name)); it != table_->definitions.end())
        return it->second;
    return std::nullopt;
}

Result<void> Registry::validate() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    const auto &defs = table_->definitions;
    for (const auto &[name, c] : defs) {
        std::optional<std::string> missing;
        for_each_reference(c, [&](const node::Reference &ref) {
            if (!missing && !defs.contains(ref.name))
                missing = ref.name;
        });
        if (missing)
            return fail(ErrorKind::ReferenceError, Path{name},
                        fmt::format("reference to undefined name '{}'", *missing));
    }

    // Alias edges: a definition that is itself just a reference.
    std::unordered_map<std::string, STATUS> status;
    std::function<Result<void>(const std::string &)> dfs = [&](const std::string &u) -> Result<void> {
        status[u] = STATUS::WORKING;
        if (const auto *ref = std::get_if<node::Reference>(&defs.at(u).node().kind)) {
            if (status[ref->name] == STATUS::UNSTARTED) {
                if (auto res = dfs(ref->name); !res)
                    return res;
            } else if (status[ref->name] == STATUS::WORKING) {
                return fail(ErrorKind::ReferenceError, Path{u}, fmt::format("alias cycle through '{}'", ref->name));
            }
        }
        status[u] = STATUS::FINISHED;
        return {};
    };

    for (const auto &[name, c] : defs) {
        if (status[name] == STATUS::UNSTARTED) {
            if (auto res = dfs(name); !res)
                return res;
        }
    }
    return {};
}

bool Registry::is_recursive(const std::string &name) const {
    return construe::is_recursive(*table_, name);
}

bool is_recursive(const RegistryTable &table, const std::string &name) {
    std::unordered_set<std::string> seen;
    std::function<bool(const std::string &)> reaches = [&](const std::string &from) {
        auto it = table.definitions.find(from);
        if (it == table.definitions.end() || !seen.insert(from).second)
            return false;
        bool found = false;
        for_each_reference(it->second, [&](const node::Reference &ref) {
            found = found || ref.name == name || reaches(ref.name);
        });
        return found;
    };
    return reaches(name);
}

namespace engine {

Result<Construct> resolve(const node::Reference &ref, const Path &path) {
    auto table = ref.table.lock();
    if (!table)
        return fail(ErrorKind::ReferenceError, path, fmt::format("registry for '{}' no longer exists", ref.name));

    // Follow aliases to the first real construct, bounded so an alias cycle cannot spin.
    const node::Reference *at = &ref;
    for (size_t hops = 0; hops <= table->definitions.size(); ++hops) {
        auto it = table->definitions.find(at->name);
        if (it == table->definitions.end())
            return fail(ErrorKind::ReferenceError, path, fmt::format("undefined name '{}'", at->name));
        const auto *next = std::get_if<node::Reference>(&it->second.node().kind);
        if (!next)
            return it->second;
        at = next;
    }
    return fail(ErrorKind::ReferenceError, path, fmt::format("alias cycle through '{}'", ref.name));
}

Result<Value> parse(const node::Reference &k, const Node &, Io &io, Session &s, FrameId frame) {
    auto target = resolve(k, s.path);
    if (!target)
        return std::unexpected(target.error());
    return parse(target->node(), io, s, frame);
}

Result<size_t> build(const node::Reference &k, const Node &, const Value &value, Io &io, Session &s, FrameId frame,
                     Value *built) {
    auto target = resolve(k, s.path);
    if (!target)
        return std::unexpected(target.error());
    return build(target->node(), value, io, s, frame, built);
}

Result<size_t> size_of(const node::Reference &k, const Node &, Session &s, FrameId frame) {
    if (std::find(s.sizing.begin(), s.sizing.end(), k.name) != s.sizing.end())
        return fail(ErrorKind::SizeofError, s.path, fmt::format("recursive reference '{}' has no static size", k.name));
    auto target = resolve(k, s.path);
    if (!target)
        return std::unexpected(target.error());
    s.sizing.push_back(k.name);
    auto n = size_of(target->node(), s, frame);
    s.sizing.pop_back();
    return n;
}

} // namespace engine

} // namespace construe
