#pragma once

/// @file native.hpp
/// @brief NativeValue: the fully materialized form of a JSON value.
///
/// A closed tagged union of exactly six kinds: null, boolean, number
/// (double), string, array and object. Value::value() produces it and
/// decode() builds it straight from bytes. Strings, arrays and objects
/// live on the heap behind the tag; copy, move and destruction are managed
/// by hand.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "object.hpp"

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyjson {

using NativeArray  = std::vector<NativeValue>;
using NativeObject = basic_object<NativeValue>;

struct SerializeOptions;

class NativeValue {
public:
    NativeValue() noexcept : kind_(Kind::Null) { u_.d = 0.0; }
    NativeValue(std::nullptr_t) noexcept : kind_(Kind::Null) { u_.d = 0.0; }
    NativeValue(bool v) noexcept : kind_(Kind::Boolean) { u_.d = 0.0; u_.b = v; }

    /// Every arithmetic type other than bool is stored as a double.
    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    NativeValue(T v) noexcept : kind_(Kind::Number) { u_.d = static_cast<double>(v); }

    NativeValue(const char* v) : kind_(Kind::Null) {
        u_.d = 0.0;
        if (LAZYJSON_UNLIKELY(!v)) return;
        u_.str = new std::string(v);
        kind_ = Kind::String;
    }
    NativeValue(std::string_view v) : kind_(Kind::String) { u_.str = new std::string(v); }
    NativeValue(const std::string& v) : kind_(Kind::String) { u_.str = new std::string(v); }
    NativeValue(std::string&& v) : kind_(Kind::String) { u_.str = new std::string(std::move(v)); }

    NativeValue(const NativeArray& v) : kind_(Kind::Array) { u_.arr = new NativeArray(v); }
    NativeValue(NativeArray&& v) : kind_(Kind::Array) { u_.arr = new NativeArray(std::move(v)); }
    NativeValue(const NativeObject& v) : kind_(Kind::Object) { u_.obj = new NativeObject(v); }
    NativeValue(NativeObject&& v) : kind_(Kind::Object) { u_.obj = new NativeObject(std::move(v)); }

    NativeValue(const NativeValue& o) : kind_(o.kind_) { copy_payload(o); }
    NativeValue(NativeValue&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Kind::Null;  // destroy() becomes a no-op
    }
    NativeValue& operator=(const NativeValue& o) {
        if (this != &o) { NativeValue tmp(o); swap(tmp); }
        return *this;
    }
    NativeValue& operator=(NativeValue&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Kind::Null;
        }
        return *this;
    }
    ~NativeValue() { destroy(); }

    void swap(NativeValue& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static NativeValue array() { return NativeValue(NativeArray{}); }
    [[nodiscard]] static NativeValue object() { return NativeValue(NativeObject{}); }

    // ─── Kind queries ────────────────────────────────────────────────────
    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()   const noexcept { return kind_ == Kind::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind_ == Kind::Boolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == Kind::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Kind::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind_ == Kind::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Kind::Object; }

    // ─── Typed access ────────────────────────────────────────────────────
    bool as_bool() const {
        if (LAZYJSON_UNLIKELY(!is_bool())) type_error("boolean");
        return u_.b;
    }
    double as_number() const {
        if (LAZYJSON_UNLIKELY(!is_number())) type_error("number");
        return u_.d;
    }
    [[nodiscard]] const std::string& as_string() const {
        if (LAZYJSON_UNLIKELY(!is_string())) type_error("string");
        return *u_.str;
    }
    [[nodiscard]] const NativeArray& as_array() const {
        if (LAZYJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    NativeArray& as_array() {
        if (LAZYJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    [[nodiscard]] const NativeObject& as_object() const {
        if (LAZYJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }
    NativeObject& as_object() {
        if (LAZYJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }

    // ─── Element access ──────────────────────────────────────────────────

    /// Member by key. Throws TypeError on a non-object, Undefined when the
    /// key is absent.
    const NativeValue& at(std::string_view key) const {
        const NativeValue* p = as_object().find(key);
        if (LAZYJSON_UNLIKELY(!p)) throw Undefined(std::string(key));
        return *p;
    }

    /// Element by position. Throws TypeError on a non-array, Undefined when
    /// out of range.
    const NativeValue& at(size_t index) const {
        const auto& a = as_array();
        if (LAZYJSON_UNLIKELY(index >= a.size())) throw Undefined();
        return a[index];
    }

    [[nodiscard]] const NativeValue* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }

    void push_back(NativeValue v) { as_array().push_back(std::move(v)); }
    void insert(std::string key, NativeValue v) { as_object().insert(std::move(key), std::move(v)); }

    // ─── Comparison ──────────────────────────────────────────────────────

    /// Structural equality; object member order is ignored.
    [[nodiscard]] bool operator==(const NativeValue& other) const {
        if (kind_ != other.kind_) return false;
        switch (kind_) {
            case Kind::NotJson:
            case Kind::Null:    return true;
            case Kind::Boolean: return u_.b == other.u_.b;
            case Kind::Number:  return u_.d == other.u_.d;
            case Kind::String:  return *u_.str == *other.u_.str;
            case Kind::Array:   return *u_.arr == *other.u_.arr;
            case Kind::Object:  return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const NativeValue& other) const { return !(*this == other); }

    // ─── Serialization (defined in codec.hpp) ────────────────────────────
    [[nodiscard]] std::string dump(int indent = -1) const;
    [[nodiscard]] std::string dump(const SerializeOptions& opts) const;

private:
    Kind kind_;
    union Payload {
        bool b;
        double d;
        std::string* str;
        NativeArray* arr;
        NativeObject* obj;
    } u_;

    [[noreturn]] void type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + kind_name(kind_));
    }

    void copy_payload(const NativeValue& o) {
        switch (o.kind_) {
            case Kind::String: u_.str = new std::string(*o.u_.str); break;
            case Kind::Array:  u_.arr = new NativeArray(*o.u_.arr); break;
            case Kind::Object: u_.obj = new NativeObject(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Kind::String: delete u_.str; break;
            case Kind::Array:  delete u_.arr; break;
            case Kind::Object: delete u_.obj; break;
            default: break;
        }
    }
};

} // namespace lazyjson
