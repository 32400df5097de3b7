#pragma once

#include "mcregion/nbt.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace mcregion::easy {

// Typed lookups over decoded compounds. A missing key or a tag of another type
// yields nullptr / nullopt rather than throwing.

template <typename T>
inline const T* get_if(const Compound& c, const std::string& key) {
    const Tag* t = c.find(key);
    if (!t) return nullptr;
    return std::get_if<T>(&t->v);
}

template <typename T>
inline std::optional<T> get(const Compound& c, const std::string& key) {
    static_assert(std::is_trivially_copyable_v<T> || std::is_same_v<T, std::string>,
                  "get<T> copies the value; use get_if for containers");
    const T* p = get_if<T>(c, key);
    if (!p) return std::nullopt;
    return *p;
}

/// Widens any integral tag (byte/short/int/long) to int64.
inline std::optional<std::int64_t> get_integer(const Compound& c, const std::string& key) {
    const Tag* t = c.find(key);
    if (!t) return std::nullopt;
    switch (t->id()) {
        case TagId::Byte: return std::get<std::int8_t>(t->v);
        case TagId::Short: return std::get<std::int16_t>(t->v);
        case TagId::Int: return std::get<std::int32_t>(t->v);
        case TagId::Long: return std::get<std::int64_t>(t->v);
        default: return std::nullopt;
    }
}

/// Follows a dot-separated path of compound keys, e.g. "Level.Sections".
inline const Tag* find_path(const Compound& root, const std::string& path) {
    const Compound* cur = &root;
    const Tag* found = nullptr;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        if (dot == std::string::npos) dot = path.size();
        std::string part = path.substr(start, dot - start);
        if (!cur) return nullptr;
        found = cur->find(part);
        if (!found) return nullptr;
        cur = std::get_if<Compound>(&found->v);
        if (dot == path.size()) break;
        start = dot + 1;
    }
    return found;
}

/// Element count for lists, compounds and arrays, byte length for strings,
/// 0 for scalars.
inline std::size_t child_count(const Tag& t) {
    switch (t.id()) {
        case TagId::ByteArray: return std::get<ByteArray>(t.v).size();
        case TagId::String: return std::get<std::string>(t.v).size();
        case TagId::List: return std::get<List>(t.v).items.size();
        case TagId::Compound: return std::get<Compound>(t.v).size();
        case TagId::IntArray: return std::get<IntArray>(t.v).size();
        case TagId::LongArray: return std::get<LongArray>(t.v).size();
        default: return 0;
    }
}

} // namespace mcregion::easy
