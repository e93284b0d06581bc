#pragma once

/// @file codec.hpp
/// @brief Conversion between JSON bytes and NativeValue.
///
///   - decode(): strict parse; numbers become double, a repeated object key
///     keeps its first position and takes its last value
///   - encode(): compact by default, pretty-printed with indent >= 0,
///     ASCII-only output with ensure_ascii

#include "config.hpp"
#include "detail/dtoa.hpp"
#include "detail/scanner.hpp"
#include "detail/simd.hpp"
#include "detail/utf8.hpp"
#include "native.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lazyjson {

/// @brief Serialization options.
struct SerializeOptions {
    int indent = -1;           ///< Indentation (-1 = compact, >= 0 = pretty-printed)
    bool ensure_ascii = false; ///< Encode all non-ASCII characters as \uXXXX
    bool sort_keys = false;    ///< Emit object members in key order
};

namespace detail {

// =====================================================================
// Decoding
// =====================================================================

inline NativeValue decode_value(Scanner& s) {
    switch (s.peek()) {
        case '"': {
            std::string text;
            s.scan_string(&text);
            return NativeValue(std::move(text));
        }
        case '{': {
            NativeObject obj;
            if (s.open_container('{', '}')) return NativeValue(std::move(obj));
            std::string key;
            do {
                key.clear();
                s.read_key(&key);
                NativeValue member = decode_value(s);
                obj.insert(std::move(key), std::move(member));
            } while (s.next_element('}'));
            return NativeValue(std::move(obj));
        }
        case '[': {
            NativeArray arr;
            if (s.open_container('[', ']')) return NativeValue(std::move(arr));
            do {
                arr.push_back(decode_value(s));
            } while (s.next_element(']'));
            return NativeValue(std::move(arr));
        }
        case 't': s.expect_literal("true");  return NativeValue(true);
        case 'f': s.expect_literal("false"); return NativeValue(false);
        case 'n': s.expect_literal("null");  return NativeValue(nullptr);
        case '-':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return NativeValue(s.read_number());
        default:
            s.error_unexpected_char();
    }
}

// =====================================================================
// Encoding
// =====================================================================

inline constexpr char kHexDigits[] = "0123456789abcdef";

/// Escape text for control bytes 0x00..0x1F.
inline void write_control_escape(std::string& out, unsigned char c) {
    switch (c) {
        case '\b': out.append("\\b", 2); return;
        case '\t': out.append("\\t", 2); return;
        case '\n': out.append("\\n", 2); return;
        case '\f': out.append("\\f", 2); return;
        case '\r': out.append("\\r", 2); return;
        default: {
            const char buf[6] = {'\\', 'u', '0', '0', kHexDigits[c >> 4], kHexDigits[c & 0xF]};
            out.append(buf, sizeof(buf));
        }
    }
}

template <bool EnsureAscii>
void write_string(std::string& out, std::string_view s) {
    out.push_back('"');
    const char* ptr = s.data();
    const char* const end = ptr + s.size();

    while (ptr < end) {
        const char* safe_end = simd::find_needs_escape<EnsureAscii>(ptr, end);
        if (safe_end > ptr) {
            out.append(ptr, static_cast<size_t>(safe_end - ptr));
            ptr = safe_end;
            if (ptr >= end) break;
        }

        const auto c = static_cast<unsigned char>(*ptr);
        if (c < 0x20) {
            write_control_escape(out, c);
        } else if (c == '"') {
            out.append("\\\"", 2);
        } else if (c == '\\') {
            out.append("\\\\", 2);
        } else if constexpr (EnsureAscii) {
            utf8::encode_escaped(utf8::decode(ptr, end), out);
            continue;
        }
        ++ptr;
    }
    out.push_back('"');
}

/// Quoted, escaped form of @p s appended to @p out.
inline void write_escaped(std::string& out, std::string_view s, bool ensure_ascii = false) {
    if (ensure_ascii) write_string<true>(out, s);
    else write_string<false>(out, s);
}

/// Number text appended to @p out; NaN and infinities are written as null.
inline void write_number(std::string& out, double val) {
    if (LAZYJSON_UNLIKELY(!std::isfinite(val))) {
        out.append("null", 4);
        return;
    }
    char buf[40];
    out.append(buf, format_number(buf, val));
}

/// @brief Encoder: compile-time switches for pretty printing and ASCII
/// escaping, so compact output carries no indentation branches.
template <bool Pretty, bool EnsureAscii>
class Encoder {
public:
    Encoder(std::string& out, const SerializeOptions& opts) noexcept
        : out_(out), opts_(opts) {}

    void write_value(const NativeValue& v) {
        switch (v.kind()) {
            case Kind::NotJson:
            case Kind::Null:
                out_.append("null", 4);
                break;
            case Kind::Boolean:
                if (v.as_bool()) out_.append("true", 4);
                else out_.append("false", 5);
                break;
            case Kind::Number:
                write_number(out_, v.as_number());
                break;
            case Kind::String:
                write_string<EnsureAscii>(out_, v.as_string());
                break;
            case Kind::Array:
                write_array(v.as_array());
                break;
            case Kind::Object:
                write_object(v.as_object());
                break;
        }
    }

private:
    std::string& out_;
    const SerializeOptions& opts_;
    int current_indent_ = 0;

    void write_newline_indent() {
        if constexpr (Pretty) {
            out_.push_back('\n');
            out_.append(static_cast<size_t>(current_indent_), ' ');
        }
    }

    void write_array(const NativeArray& arr) {
        if (arr.empty()) { out_.append("[]", 2); return; }
        out_.push_back('[');
        if constexpr (Pretty) current_indent_ += opts_.indent;
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out_.push_back(',');
            write_newline_indent();
            write_value(arr[i]);
        }
        if constexpr (Pretty) current_indent_ -= opts_.indent;
        write_newline_indent();
        out_.push_back(']');
    }

    void write_member(const std::string& key, const NativeValue& val, bool first) {
        if (!first) out_.push_back(',');
        write_newline_indent();
        write_string<EnsureAscii>(out_, key);
        out_.push_back(':');
        if constexpr (Pretty) out_.push_back(' ');
        write_value(val);
    }

    void write_object(const NativeObject& obj) {
        if (obj.empty()) { out_.append("{}", 2); return; }
        out_.push_back('{');
        if constexpr (Pretty) current_indent_ += opts_.indent;
        if (opts_.sort_keys) {
            std::vector<const NativeObject::value_type*> sorted;
            sorted.reserve(obj.size());
            for (const auto& entry : obj) sorted.push_back(&entry);
            std::sort(sorted.begin(), sorted.end(),
                      [](const auto* a, const auto* b) { return a->first < b->first; });
            bool first = true;
            for (const auto* entry : sorted) {
                write_member(entry->first, entry->second, first);
                first = false;
            }
        } else {
            bool first = true;
            for (const auto& [key, val] : obj) {
                write_member(key, val, first);
                first = false;
            }
        }
        if constexpr (Pretty) current_indent_ -= opts_.indent;
        write_newline_indent();
        out_.push_back('}');
    }
};

template <bool Pretty, bool EnsureAscii>
void encode_with(std::string& out, const NativeValue& v, const SerializeOptions& opts) {
    Encoder<Pretty, EnsureAscii> encoder(out, opts);
    encoder.write_value(v);
}

} // namespace detail

// =====================================================================
// Public API
// =====================================================================

/// @brief Parse @p bytes into a NativeValue. Throws ParseError on
/// malformed input.
[[nodiscard]] inline NativeValue decode(std::string_view bytes) {
    detail::Scanner scanner(bytes);
    NativeValue result = detail::decode_value(scanner);
    scanner.finish();
    return result;
}

/// @brief Append the JSON text of @p value to @p out.
inline void encode_to(std::string& out, const NativeValue& value,
                      const SerializeOptions& opts = {}) {
    const bool pretty = opts.indent >= 0;
    if (pretty) {
        if (opts.ensure_ascii) detail::encode_with<true, true>(out, value, opts);
        else detail::encode_with<true, false>(out, value, opts);
    } else {
        if (opts.ensure_ascii) detail::encode_with<false, true>(out, value, opts);
        else detail::encode_with<false, false>(out, value, opts);
    }
}

/// @brief JSON text of @p value.
[[nodiscard]] inline std::string encode(const NativeValue& value,
                                        const SerializeOptions& opts = {}) {
    std::string out;
    encode_to(out, value, opts);
    return out;
}

// ─── NativeValue serialization members ───────────────────────────────────

inline std::string NativeValue::dump(int indent) const {
    SerializeOptions opts;
    opts.indent = indent;
    return encode(*this, opts);
}

inline std::string NativeValue::dump(const SerializeOptions& opts) const {
    return encode(*this, opts);
}

inline std::ostream& operator<<(std::ostream& os, const NativeValue& v) {
    return os << encode(v);
}

} // namespace lazyjson
