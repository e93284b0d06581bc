#pragma once

/// @file value.hpp
/// @brief Value: a lazily parsed JSON node with an overlay layer.
///
/// A Value built from bytes keeps them untouched and answers navigation by
/// locating sub-ranges in place. Nothing is decoded until value() asks for
/// the native form. Writes never touch the bytes: they land in the parsed
/// structure when there is one, otherwise in an overlay table that is merged
/// in on read.
///
/// Values are always handled through ValuePtr. Wrapping an existing Value in
/// a container adopts the handle, so one node may sit in several trees and a
/// write through any of them is seen by all.
///
/// @code
///   auto doc = lazyjson::Value::from_bytes(R"({"name":"marty","age":7})");
///   doc->set_path("name", "steve");
///   doc->path("name")->value()->as_string();   // "steve"
///   doc->bytes();                              // {"name":"steve","age":7}
/// @endcode

#include "codec.hpp"
#include "config.hpp"
#include "detail/scanner.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "locator.hpp"
#include "native.hpp"
#include "object.hpp"
#include "pointer.hpp"
#include "validator.hpp"

#include <charconv>
#include <climits>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lazyjson {

class Value : public std::enable_shared_from_this<Value> {
    struct Private { explicit Private() = default; };

public:
    using Array  = std::vector<ValuePtr>;
    using Object = basic_object<ValuePtr>;

    /// @brief Anything a Value can be built from.
    ///
    /// Native literals and containers are wrapped into new Values; a
    /// ValuePtr is adopted as is. There is no constructor for other types,
    /// so passing one fails to compile.
    class Input {
    public:
        Input(std::nullptr_t) : ptr_(scalar(NativeValue(nullptr))) {}
        Input(bool v) : ptr_(scalar(NativeValue(v))) {}

        template <typename T,
                  std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool> &&
                                   !std::is_same_v<T, char>, int> = 0>
        Input(T v) : ptr_(scalar(NativeValue(v))) {}

        /// A char is a one-character string, not its code.
        Input(char c) : ptr_(scalar(NativeValue(std::string(1, c)))) {}

        Input(const char* v) : ptr_(scalar(NativeValue(v))) {}
        Input(std::string_view v) : ptr_(scalar(NativeValue(v))) {}
        Input(std::string v) : ptr_(scalar(NativeValue(std::move(v)))) {}

        Input(const NativeValue& v) : ptr_(from_native(v)) {}
        Input(const NativeArray& v) : ptr_(from_native(NativeValue(v))) {}
        Input(const NativeObject& v) : ptr_(from_native(NativeValue(v))) {}

        Input(ValuePtr v) : ptr_(std::move(v)) {
            if (LAZYJSON_UNLIKELY(!ptr_)) throw InvariantError("null Value handle used as input");
        }

        [[nodiscard]] const ValuePtr& get() const noexcept { return ptr_; }
        ValuePtr release() && noexcept { return std::move(ptr_); }

    private:
        ValuePtr ptr_;
    };

    // Public for std::make_shared; Private keeps it out of reach.
    Value(Private, Kind kind) noexcept : kind_(kind) {}
    Value(Private, Kind kind, std::shared_ptr<const std::string> buffer, std::string_view raw) noexcept
        : kind_(kind), buffer_(std::move(buffer)), raw_(raw) {}

    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;

    // =====================================================================
    // Construction
    // =====================================================================

    /// @brief Bytes-backed Value. The bytes are validated and classified
    /// once; invalid bytes give a NotJson Value rather than an error.
    [[nodiscard]] static ValuePtr from_bytes(std::string bytes) {
        auto buffer = std::make_shared<const std::string>(std::move(bytes));
        const std::string_view raw(*buffer);
        return std::make_shared<Value>(Private{}, classify(raw), std::move(buffer), raw);
    }

    /// @brief Value for a native literal or container; a ValuePtr comes back
    /// unchanged.
    [[nodiscard]] static ValuePtr make(Input v) { return std::move(v).release(); }

    /// @brief Array Value. Elements that are Values are adopted by reference.
    [[nodiscard]] static ValuePtr make_array(std::vector<Input> elements) {
        Array items;
        items.reserve(elements.size());
        for (auto& e : elements) items.push_back(std::move(e).release());
        auto v = std::make_shared<Value>(Private{}, Kind::Array);
        v->parsed_ = std::move(items);
        return v;
    }

    /// @brief Object Value. Member values that are Values are adopted by
    /// reference; a repeated key keeps its first position and last value.
    [[nodiscard]] static ValuePtr make_object(std::vector<std::pair<std::string, Input>> members) {
        Object table;
        table.reserve(members.size());
        for (auto& [key, input] : members) table.insert(std::move(key), std::move(input).release());
        auto v = std::make_shared<Value>(Private{}, Kind::Object);
        v->parsed_ = std::move(table);
        return v;
    }

    /// @brief Deep wrap of a native value: every element becomes its own Value.
    [[nodiscard]] static ValuePtr from_native(const NativeValue& native) {
        switch (native.kind()) {
            case Kind::Array: {
                Array items;
                items.reserve(native.size());
                for (const auto& e : native.as_array()) items.push_back(from_native(e));
                auto v = std::make_shared<Value>(Private{}, Kind::Array);
                v->parsed_ = std::move(items);
                return v;
            }
            case Kind::Object: {
                Object table;
                table.reserve(native.size());
                for (const auto& [key, member] : native.as_object())
                    table.insert(key, from_native(member));
                auto v = std::make_shared<Value>(Private{}, Kind::Object);
                v->parsed_ = std::move(table);
                return v;
            }
            default:
                return scalar(native);
        }
    }

    // =====================================================================
    // State
    // =====================================================================

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    /// @brief True once the node holds a structure (always for constructed
    /// Values; for bytes-backed containers after bytes() split them).
    [[nodiscard]] bool is_parsed() const noexcept { return parsed_.index() != 0; }

    [[nodiscard]] bool has_overlay() const noexcept { return overlay_ && !overlay_->empty(); }

    /// @brief This node's original bytes, when it was built from bytes.
    [[nodiscard]] std::optional<std::string_view> raw() const noexcept {
        if (!buffer_) return std::nullopt;
        return raw_;
    }

    // =====================================================================
    // Navigation
    // =====================================================================

    /// @brief Member @p name: overlay first, then the parsed object, then
    /// the raw bytes.
    /// @throws Undefined     the member does not exist
    /// @throws PointerError  bytes-backed scalar, or a bytes-backed array
    ///                       and @p name is not an index
    /// @throws ParseError    malformed raw bytes
    [[nodiscard]] ValuePtr path(std::string_view name) const {
        if (overlay_) {
            if (const ValuePtr* hit = overlay_->find(name)) return *hit;
        }
        if (const auto* obj = std::get_if<Object>(&parsed_)) {
            if (const ValuePtr* hit = obj->find(name)) return *hit;
        } else if (const auto* arr = std::get_if<Array>(&parsed_)) {
            // Read the name as the locator reads it on the raw array.
            const auto pos = Pointer::parse_index(name);
            if (pos) {
                if (*pos < arr->size()) return (*arr)[*pos];
            } else if (buffer_) {
                throw PointerError("invalid array index \"" + std::string(name) + "\"",
                                   errc::invalid_array_index);
            }
        } else if (navigable_bytes()) {
            if (auto found = find(raw_, Pointer::from_token(std::string(name))))
                return child(*found);
        }
        throw Undefined(std::string(name));
    }

    /// @brief Element @p i, resolved like path(). Negative or out of range
    /// positions throw an Undefined without a name.
    [[nodiscard]] ValuePtr index(int i) const {
        if (i < 0) throw Undefined();
        const auto pos = static_cast<size_t>(i);
        if (overlay_) {
            if (const ValuePtr* hit = overlay_->find(std::to_string(i))) return *hit;
        }
        if (const auto* arr = std::get_if<Array>(&parsed_)) {
            if (pos < arr->size()) return (*arr)[pos];
        } else if (const auto* obj = std::get_if<Object>(&parsed_)) {
            if (const ValuePtr* hit = obj->find(std::to_string(i))) return *hit;
        } else if (navigable_bytes()) {
            if (auto found = find(raw_, Pointer::from_index(pos)))
                return child(*found);
        }
        throw Undefined();
    }

    /// @brief Exception-free path(). The error code is errc::undefined or
    /// the locator's code.
    [[nodiscard]] result<ValuePtr> try_path(std::string_view name) const {
        try {
            return {path(name), {}};
        } catch (const std::system_error& e) {
            return {nullptr, e.code()};
        }
    }

    /// @brief Exception-free index().
    [[nodiscard]] result<ValuePtr> try_index(int i) const {
        try {
            return {index(i), {}};
        } catch (const std::system_error& e) {
            return {nullptr, e.code()};
        }
    }

    /// @brief Follow @p pointer one token at a time. On arrays a token must
    /// be a canonical index, otherwise the step is Undefined.
    [[nodiscard]] ValuePtr at_pointer(const Pointer& pointer) const {
        auto current = std::const_pointer_cast<Value>(shared_from_this());
        for (const auto& token : pointer.tokens()) {
            if (current->kind() == Kind::Array) {
                const auto pos = Pointer::parse_index(token);
                if (!pos || *pos > static_cast<size_t>(INT_MAX)) throw Undefined(token);
                current = current->index(static_cast<int>(*pos));
            } else {
                current = current->path(token);
            }
        }
        return current;
    }

    /// @brief at_pointer() with the pointer in RFC 6901 text form.
    [[nodiscard]] ValuePtr at_pointer(std::string_view pointer) const {
        return at_pointer(Pointer(pointer));
    }

    // =====================================================================
    // Overlay writes
    // =====================================================================

    /// @brief Set member @p name. Ignored unless this is an Object.
    void set_path(std::string_view name, Input val) {
        if (kind_ != Kind::Object) return;
        ValuePtr v = std::move(val).release();
        if (auto* obj = std::get_if<Object>(&parsed_)) {
            obj->insert(std::string(name), std::move(v));
            if (overlay_) overlay_->erase(name);
            return;
        }
        overlay().insert(std::string(name), std::move(v));
    }

    /// @brief Set element @p i. Ignored unless this is an Array and i >= 0.
    /// A parsed array never grows: writes past its end are dropped.
    void set_index(int i, Input val) {
        if (kind_ != Kind::Array || i < 0) return;
        ValuePtr v = std::move(val).release();
        const auto pos = static_cast<size_t>(i);
        if (auto* arr = std::get_if<Array>(&parsed_)) {
            if (pos < arr->size()) {
                (*arr)[pos] = std::move(v);
                if (overlay_) overlay_->erase(std::to_string(i));
            }
            return;
        }
        overlay().insert(std::to_string(i), std::move(v));
    }

    // =====================================================================
    // Materialization
    // =====================================================================

    /// @brief The native form of the whole sub-tree with overlays applied.
    /// Empty for NotJson.
    [[nodiscard]] std::optional<NativeValue> value() const {
        if (const auto* native = std::get_if<NativeValue>(&parsed_)) return *native;

        NativeValue result;
        if (const auto* arr = std::get_if<Array>(&parsed_)) {
            NativeArray out;
            out.reserve(arr->size());
            for (const auto& item : *arr) {
                auto v = item->value();
                out.push_back(v ? std::move(*v) : NativeValue(nullptr));
            }
            result = NativeValue(std::move(out));
        } else if (const auto* obj = std::get_if<Object>(&parsed_)) {
            NativeObject out;
            out.reserve(obj->size());
            for (const auto& [key, member] : *obj) {
                if (auto v = member->value()) out.insert(key, std::move(*v));
            }
            result = NativeValue(std::move(out));
        } else if (kind_ == Kind::NotJson) {
            return std::nullopt;
        } else {
            if (!decoded_) decoded_ = decode_raw();
            result = *decoded_;
        }
        merge_overlay(result);
        return result;
    }

    // =====================================================================
    // Serialization
    // =====================================================================

    /// @brief JSON text of this node with overlays applied. Untouched
    /// sub-trees are copied from their original bytes.
    [[nodiscard]] std::string bytes() const {
        std::string out;
        write_bytes(out);
        return out;
    }

    /// @brief Append bytes() to @p out.
    void write_bytes(std::string& out) const {
        if (!is_container(kind_)) {
            if (buffer_) out.append(raw_);
            else encode_to(out, std::get<NativeValue>(parsed_));
            return;
        }
        if (!is_parsed() && !has_overlay() && buffer_) {
            out.append(raw_);
            return;
        }
        ensure_parsed();
        if (kind_ == Kind::Array) write_array(out);
        else write_object(out);
    }

    // =====================================================================
    // Metadata
    // =====================================================================

    /// @brief Set @p key in the metadata object, creating it on first use.
    void add_metadata(std::string_view key, Input val) {
        if (!meta_) meta_ = make_object({});
        meta_->set_path(key, std::move(val));
    }

    /// @brief The metadata object, or nullptr if none was ever written.
    [[nodiscard]] const ValuePtr& metadata() const noexcept { return meta_; }

private:
    Kind kind_;
    std::shared_ptr<const std::string> buffer_;  // shared with children split from it
    std::string_view raw_;
    mutable std::variant<std::monostate, NativeValue, Array, Object> parsed_;
    mutable std::optional<NativeValue> decoded_;  // raw_ decoded by value(), overlay not applied
    std::unique_ptr<Object> overlay_;
    ValuePtr meta_;

    static ValuePtr scalar(NativeValue native) {
        auto v = std::make_shared<Value>(Private{}, native.kind());
        v->parsed_ = std::move(native);
        return v;
    }

    /// Sub-range of our buffer as a new Value. The range came out of bytes
    /// that passed validation, so only its first byte is inspected.
    ValuePtr child(std::string_view slice) const {
        return std::make_shared<Value>(Private{}, classify_valid(slice), buffer_, slice);
    }

    bool navigable_bytes() const noexcept {
        return !is_parsed() && buffer_ && kind_ != Kind::NotJson;
    }

    Object& overlay() {
        if (!overlay_) overlay_ = std::make_unique<Object>();
        return *overlay_;
    }

    static size_t overlay_position(const std::string& key) {
        size_t pos = 0;
        const char* end = key.data() + key.size();
        auto [ptr, ec] = std::from_chars(key.data(), end, pos);
        if (LAZYJSON_UNLIKELY(ec != std::errc() || ptr != end || key.empty()))
            throw InvariantError("array overlay key \"" + key + "\" is not an index");
        return pos;
    }

    NativeValue decode_raw() const {
        try {
            return decode(raw_);
        } catch (const ParseError& e) {
            throw InvariantError(std::string("validated bytes failed to decode: ") + e.what());
        }
    }

    void merge_overlay(NativeValue& target) const {
        if (!overlay_) return;
        if (target.is_object()) {
            auto& obj = target.as_object();
            for (const auto& [key, v] : *overlay_) {
                if (v->kind() == Kind::NotJson) continue;
                obj.insert(key, *v->value());
            }
        } else if (target.is_array()) {
            auto& arr = target.as_array();
            for (const auto& [key, v] : *overlay_) {
                const size_t pos = overlay_position(key);
                if (pos >= arr.size() || v->kind() == Kind::NotJson) continue;
                arr[pos] = *v->value();
            }
        }
    }

    /// Split the raw container into bytes-backed children, once.
    void ensure_parsed() const {
        if (is_parsed()) return;
        try {
            detail::Scanner scanner(raw_);
            if (kind_ == Kind::Array) {
                Array items;
                if (!scanner.open_container('[', ']')) {
                    do {
                        items.push_back(child(next_slice(scanner)));
                    } while (scanner.next_element(']'));
                }
                parsed_ = std::move(items);
            } else {
                Object table;
                if (!scanner.open_container('{', '}')) {
                    std::string key;
                    do {
                        key.clear();
                        scanner.read_key(&key);
                        table.insert(std::move(key), child(next_slice(scanner)));
                    } while (scanner.next_element('}'));
                }
                parsed_ = std::move(table);
            }
        } catch (const ParseError& e) {
            throw InvariantError(std::string("validated bytes failed to split: ") + e.what());
        }
    }

    static std::string_view next_slice(detail::Scanner& scanner) {
        scanner.skip_whitespace();
        const char* start = scanner.position();
        scanner.skip_value();
        return std::string_view(start, static_cast<size_t>(scanner.position() - start));
    }

    void write_array(std::string& out) const {
        Array items = std::get<Array>(parsed_);
        if (overlay_) {
            for (const auto& [key, v] : *overlay_) {
                const size_t pos = overlay_position(key);
                if (pos < items.size() && v->kind() != Kind::NotJson) items[pos] = v;
            }
        }
        out.push_back('[');
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out.push_back(',');
            if (items[i]->kind() == Kind::NotJson) out.append("null", 4);
            else items[i]->write_bytes(out);
        }
        out.push_back(']');
    }

    void write_object(std::string& out) const {
        Object members = std::get<Object>(parsed_);
        if (overlay_) {
            for (const auto& [key, v] : *overlay_) {
                if (v->kind() != Kind::NotJson) members.insert(key, v);
            }
        }
        out.push_back('{');
        bool first = true;
        for (const auto& [key, member] : members) {
            if (member->kind() == Kind::NotJson) continue;
            if (!first) out.push_back(',');
            first = false;
            detail::write_escaped(out, key);
            out.push_back(':');
            member->write_bytes(out);
        }
        out.push_back('}');
    }
};

/// @brief Stream the JSON text of @p v (bytes()).
inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << v.bytes();
}

} // namespace lazyjson
