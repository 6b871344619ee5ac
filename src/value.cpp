#include "cst/value.hpp"

#include "cst/deferred.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace construe {

Container::Container() = default;
Container::Container(std::initializer_list<Entry> entries) {
    for (const auto &[key, value] : entries) {
        set(key, value);
    }
}
Container::Container(const Container &) = default;
Container::Container(Container &&) noexcept = default;
Container &Container::operator=(const Container &) = default;
Container &Container::operator=(Container &&) noexcept = default;
Container::~Container() = default;

bool Container::contains(std::string_view key) const {
    return find(key) != nullptr;
}

const Value *Container::find(std::string_view key) const {
    auto it = std::ranges::find_if(entries_, [key](const Entry &e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

Value *Container::find(std::string_view key) {
    auto it = std::ranges::find_if(entries_, [key](const Entry &e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

void Container::set(std::string key, Value value) {
    if (Value *slot = find(key)) {
        *slot = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

bool Container::insert(std::string key, Value value) {
    if (contains(key))
        return false;
    entries_.emplace_back(std::move(key), std::move(value));
    return true;
}

bool Container::erase(std::string_view key) {
    auto it = std::ranges::find_if(entries_, [key](const Entry &e) { return e.first == key; });
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

bool operator==(const Container &lhs, const Container &rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return std::ranges::all_of(lhs.entries_, [&rhs](const Container::Entry &e) {
        const Value *other = rhs.find(e.first);
        return other && *other == e.second;
    });
}

bool operator==(const Value &lhs, const Value &rhs) {
    using Lazy = std::shared_ptr<const Deferred>;
    const auto *a = lhs.get<Lazy>();
    const auto *b = rhs.get<Lazy>();
    if (a && b)
        return (*a)->data() == (*b)->data();
    return lhs.data_ == rhs.data_;
}

bool Value::truthy() const {
    return std::visit(
        [](const auto &v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                return v != 0;
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const Deferred>>) {
                return v != nullptr;
            } else {
                return !v.empty();
            }
        },
        data_);
}

std::string_view Value::type_name() const {
    switch (data_.index()) {
    case 0:
        return "none";
    case 1:
        return "bool";
    case 2:
        return "integer";
    case 3:
        return "float";
    case 4:
        return "bytes";
    case 5:
        return "text";
    case 6:
        return "list";
    case 7:
        return "container";
    default:
        return "deferred";
    }
}

namespace {

nlohmann::json to_json(const Value &value) {
    return std::visit(
        [](const auto &v) -> nlohmann::json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return nlohmann::json::binary(v);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const Deferred>>) {
                // Dumping never triggers the deferred parse.
                return nlohmann::json::binary(v->data());
            } else if constexpr (std::is_same_v<T, List>) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto &item : v) {
                    out.push_back(to_json(item));
                }
                return out;
            } else if constexpr (std::is_same_v<T, Container>) {
                nlohmann::json out = nlohmann::json::object();
                for (const auto &[key, item] : v) {
                    out[key] = to_json(item);
                }
                return out;
            } else {
                return v;
            }
        },
        value.storage());
}

} // namespace

std::string Value::dump(int indent) const {
    // Text read from the wire may not be valid UTF-8, so replace rather than throw.
    return to_json(*this).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

} // namespace construe
