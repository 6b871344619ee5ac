#pragma once

#include "cst/construct.hpp"
#include "cst/node.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace construe {

/** @brief Name to construct table shared by a Registry and the references it hands out. */
struct RegistryTable {
    std::unordered_map<std::string, Construct> definitions;
};

/**
 * @brief Binds names to constructs so schemas can refer to themselves.
 *
 * `ref()` may be called before the name is defined: a reference looks the name
 * up on every call, so recursive and mutually recursive schemas are assembled
 * by handing out references first and defining them afterwards.
 *
 * References only hold a weak handle on the table, since a recursive schema
 * owning its own table would never be freed. Copies of a Registry share the
 * table, so keep a copy alongside any schema that outlives the original.
 * Using a reference after every copy is gone is a ReferenceError.
 */
class Registry {
public:
    Registry() : table_(std::make_shared<RegistryTable>()) {
    }

    /**
     * @brief Binds @p name to @p construct.
     * @return ReferenceError if the name is already bound.
     */
    Result<void> define(const std::string &name, Construct construct);

    /**
     * @brief A reference node that resolves @p name at call time.
     *
     * The reference does not keep this registry alive.
     */
    Construct ref(const std::string &name) const;

    std::optional<Construct> lookup(std::string_view name) const;

    size_t size() const {
        return table_->definitions.size();
    }

    /**
     * @brief Checks the table is complete and well founded.
     *
     * Fails with ReferenceError on a reference to a name that was never
     * defined, or on a cycle made only of references (an alias cycle), which
     * would recurse without reading anything.
     */
    Result<void> validate() const;

    /** @brief True when the definition of @p name can reach a reference to itself. */
    bool is_recursive(const std::string &name) const;

private:
    std::shared_ptr<RegistryTable> table_;
};

/** @brief Same as Registry::is_recursive, for holders of a bare table. */
bool is_recursive(const RegistryTable &table, const std::string &name);

} // namespace construe
