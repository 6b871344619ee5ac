#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace construe {

using Bytes = std::vector<uint8_t>;

class Value;
using List = std::vector<Value>;

class Deferred;

/**
 * @brief Ordered key to value mapping produced by struct-like constructs.
 *
 * Insertion order is kept for iteration and dumps. Equality ignores order.
 */
class Container {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Container();
    Container(std::initializer_list<Entry> entries);
    Container(const Container &);
    Container(Container &&) noexcept;
    Container &operator=(const Container &);
    Container &operator=(Container &&) noexcept;
    ~Container();

    bool contains(std::string_view key) const;
    const Value *find(std::string_view key) const;
    Value *find(std::string_view key);

    /** @brief Inserts or overwrites @p key, keeping its original position. */
    void set(std::string key, Value value);

    /** @brief Inserts @p key only if absent. Returns false on collision. */
    bool insert(std::string key, Value value);

    bool erase(std::string_view key);

    size_t size() const {
        return entries_.size();
    }
    bool empty() const {
        return entries_.empty();
    }
    const_iterator begin() const;
    const_iterator end() const;

    friend bool operator==(const Container &lhs, const Container &rhs);

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Dynamically typed result of a parse and input of a build.
 *
 * Integers are held as int64_t. Text is UTF-8 in a std::string, raw data is Bytes.
 * An on-demand field parses to a shared Deferred that decodes when asked.
 */
class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, double, Bytes, std::string, List, Container,
                                 std::shared_ptr<const Deferred>>;

    Value() = default;
    Value(std::nullptr_t) {
    }
    Value(bool v) : data_(v) {
    }
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) : data_(static_cast<int64_t>(v)) {
    }
    Value(double v) : data_(v) {
    }
    Value(Bytes v) : data_(std::move(v)) {
    }
    Value(std::string v) : data_(std::move(v)) {
    }
    Value(const char *v) : data_(std::string(v)) {
    }
    Value(List v) : data_(std::move(v)) {
    }
    Value(Container v) : data_(std::move(v)) {
    }
    Value(std::shared_ptr<const Deferred> v) : data_(std::move(v)) {
    }

    bool is_none() const {
        return std::holds_alternative<std::monostate>(data_);
    }

    template <typename T>
    bool holds() const {
        return std::holds_alternative<T>(data_);
    }
    template <typename T>
    const T *get() const {
        return std::get_if<T>(&data_);
    }
    template <typename T>
    T *get() {
        return std::get_if<T>(&data_);
    }

    const Storage &storage() const {
        return data_;
    }

    /** @brief None, false, zero and empty collections are false. */
    bool truthy() const;

    std::string_view type_name() const;

    /** @brief Renders the value as JSON. Bytes become JSON binary values. */
    std::string dump(int indent = -1) const;

    friend bool operator==(const Value &lhs, const Value &rhs);

private:
    Storage data_;
};

/** @brief Copies the characters of @p text into a byte buffer. */
Bytes to_bytes(std::string_view text);

inline Container::const_iterator Container::begin() const {
    return entries_.begin();
}

inline Container::const_iterator Container::end() const {
    return entries_.end();
}

} // namespace construe
