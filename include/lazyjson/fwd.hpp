#pragma once

/// @file fwd.hpp
/// @brief Forward declarations, the Kind enumeration and handle aliases.

#include <cstdint>
#include <memory>
#include <vector>

namespace lazyjson {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class NativeValue;
class Pointer;

/// Top-level kind of a JSON fragment. NotJson marks bytes that failed
/// validation; it never changes once a Value is constructed.
enum class Kind : uint8_t {
    NotJson = 0,
    Null    = 1,
    Boolean = 2,
    Number  = 3,
    String  = 4,
    Array   = 5,
    Object  = 6
};

/// @brief Returns the string representation of a kind.
inline const char* kind_name(Kind k) noexcept {
    switch (k) {
        case Kind::NotJson: return "not_json";
        case Kind::Null:    return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Number:  return "number";
        case Kind::String:  return "string";
        case Kind::Array:   return "array";
        case Kind::Object:  return "object";
    }
    return "unknown";
}

/// True for the two container kinds.
inline bool is_container(Kind k) noexcept {
    return k == Kind::Array || k == Kind::Object;
}

// ─── Handle aliases ─────────────────────────────────────────────────────

/// Shared handle to a lazy value. Several parents may hold the same Value;
/// a write through any of them is visible through all.
using ValuePtr = std::shared_ptr<Value>;

/// Plain collection of Values, for callers that gather several documents.
using ValueCollection = std::vector<ValuePtr>;

} // namespace lazyjson
