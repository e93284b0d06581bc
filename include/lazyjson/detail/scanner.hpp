#pragma once

/// @file scanner.hpp
/// @brief Strict byte-level JSON walker.
///
/// One cursor over [begin, end) with the primitives the validator, the
/// pointer locator and the decoder are built from:
///   - skip_value(): consume one value, checking the full RFC 8259 grammar
///   - scan_string(): consume a string, optionally decoding it
///   - scan_number(): consume a number lexeme, optionally converting it
///   - open_container() / next_element(): walk arrays and objects
///
/// Every syntax problem throws ParseError with the line, column and byte
/// offset of the cursor. Nothing is allocated unless the caller asks for
/// decoded text.

#include "../config.hpp"
#include "../error.hpp"
#include "simd.hpp"
#include "utf8.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

namespace lazyjson::detail {

class Scanner {
public:
    explicit Scanner(std::string_view input) noexcept
        : begin_(input.data())
        , ptr_(input.data())
        , end_(input.data() + input.size()) {}

    [[nodiscard]] const char* position() const noexcept { return ptr_; }
    [[nodiscard]] bool at_end() const noexcept { return ptr_ >= end_; }

    // ─── Whitespace ──────────────────────────────────────────────────────

    void skip_whitespace() noexcept {
        if (LAZYJSON_LIKELY(ptr_ < end_ && static_cast<unsigned char>(*ptr_) > ' '))
            return;
        ptr_ = simd::skip_whitespace(ptr_, end_);
    }

    /// Next significant byte, or '\0' at the end of input.
    char peek() noexcept {
        skip_whitespace();
        return ptr_ < end_ ? *ptr_ : '\0';
    }

    /// Requires that only whitespace remains.
    void finish() {
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ < end_))
            error("unexpected trailing content", errc::trailing_content);
    }

    // ─── Values ──────────────────────────────────────────────────────────

    /// Consume one complete value, validating everything inside it.
    void skip_value() {
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

        switch (*ptr_) {
            case '"':
                scan_string(nullptr);
                return;
            case '{':
                if (open_container('{', '}')) return;
                do {
                    read_key(nullptr);
                    skip_value();
                } while (next_element('}'));
                return;
            case '[':
                if (open_container('[', ']')) return;
                do {
                    skip_value();
                } while (next_element(']'));
                return;
            case 't': expect_literal("true");  return;
            case 'f': expect_literal("false"); return;
            case 'n': expect_literal("null");  return;
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                scan_number();
                return;
            default:
                error_unexpected_char();
        }
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        if (LAZYJSON_UNLIKELY(static_cast<size_t>(end_ - ptr_) < len) ||
            LAZYJSON_UNLIKELY(std::memcmp(ptr_, literal, len) != 0)) {
            error(std::string("expected '") + literal + "'", errc::invalid_literal);
        }
        ptr_ += len;
    }

    // ─── Containers ──────────────────────────────────────────────────────

    /// Consume @p open. Returns true, with the closing byte consumed too,
    /// when the container is empty.
    bool open_container(char open, char close) {
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ >= end_ || *ptr_ != open)) error_unexpected_char();
        ++ptr_;
        push_depth();
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ >= end_)) error_unterminated(close);
        if (*ptr_ == close) {
            ++ptr_;
            pop_depth();
            return true;
        }
        return false;
    }

    /// After an element: consume ',' and return true, or consume @p close
    /// and return false.
    bool next_element(char close) {
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ >= end_)) error_unterminated(close);
        if (*ptr_ == ',') {
            ++ptr_;
            return true;
        }
        if (LAZYJSON_LIKELY(*ptr_ == close)) {
            ++ptr_;
            pop_depth();
            return false;
        }
        error(std::string("expected ',' or '") + close + "'", errc::unexpected_character);
    }

    /// Consume `"key" :`. Decodes the key into @p out when it is non-null.
    void read_key(std::string* out) {
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ >= end_)) error_unterminated('}');
        if (LAZYJSON_UNLIKELY(*ptr_ != '"')) error("expected string key", errc::unexpected_character);
        scan_string(out);
        skip_whitespace();
        if (LAZYJSON_UNLIKELY(ptr_ >= end_ || *ptr_ != ':')) {
            if (ptr_ >= end_) error_unterminated('}');
            error("expected ':' after object key", errc::unexpected_character);
        }
        ++ptr_;
    }

    // ─── Strings ─────────────────────────────────────────────────────────

    /// Consume a string starting at the opening quote. Appends the decoded
    /// text to @p out when it is non-null.
    void scan_string(std::string* out) {
        ++ptr_;  // opening quote
        for (;;) {
            const char* run = simd::find_needs_escape<false>(ptr_, end_);
            if (out && run > ptr_) out->append(ptr_, static_cast<size_t>(run - ptr_));
            ptr_ = run;

            if (LAZYJSON_UNLIKELY(ptr_ >= end_))
                error("unterminated string", errc::unterminated_string);

            const char c = *ptr_;
            if (LAZYJSON_LIKELY(c == '"')) {
                ++ptr_;
                return;
            }
            if (c == '\\') {
                ++ptr_;
                scan_escape(out);
                continue;
            }
            error("unescaped control character in string", errc::control_character);
        }
    }

    // ─── Numbers ─────────────────────────────────────────────────────────

    /// Consume `-?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?` and return
    /// the lexeme.
    std::string_view scan_number() {
        const char* start = ptr_;
        if (*ptr_ == '-') ++ptr_;

        if (LAZYJSON_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
            error("invalid number", errc::invalid_number);
        if (*ptr_ == '0') {
            ++ptr_;
        } else {
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (ptr_ < end_ && *ptr_ == '.') {
            ++ptr_;
            if (LAZYJSON_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit after decimal point", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (LAZYJSON_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit in exponent", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        return {start, static_cast<size_t>(ptr_ - start)};
    }

    /// Consume a number and convert it. Magnitudes beyond the double range
    /// become infinities, like strtod.
    double read_number() {
        const std::string_view lexeme = scan_number();
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
        double val = 0.0;
        auto [p, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), val);
        if (LAZYJSON_LIKELY(ec == std::errc{})) return val;
#endif
        const std::string buf(lexeme);
        return std::strtod(buf.c_str(), nullptr);
    }

    // ─── Errors ──────────────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location() const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(ptr_ - begin_);
        for (const char* p = begin_; p < ptr_; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] LAZYJSON_NOINLINE void error(const std::string& msg,
                                              errc code = errc::unexpected_character) const {
        throw ParseError(msg, location(), code);
    }

    [[noreturn]] LAZYJSON_NOINLINE void error_unexpected_end() const {
        throw ParseError("unexpected end of input", location(),
                         errc::unexpected_end_of_input);
    }

    [[noreturn]] LAZYJSON_NOINLINE void error_unexpected_char() const {
        if (ptr_ >= end_) error_unexpected_end();
        throw ParseError(std::string("unexpected character '") + *ptr_ + "'",
                         location(), errc::unexpected_character);
    }

private:
    static bool is_digit(char c) noexcept {
        return static_cast<unsigned>(c - '0') <= 9u;
    }

    static int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    [[noreturn]] void error_unterminated(char close) const {
        if (close == ']') error("unterminated array", errc::unterminated_array);
        error("unterminated object", errc::unterminated_object);
    }

    void push_depth() {
        if (LAZYJSON_UNLIKELY(++depth_ > LAZYJSON_MAX_DEPTH))
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
    }

    void pop_depth() noexcept { --depth_; }

    void scan_escape(std::string* out) {
        if (LAZYJSON_UNLIKELY(ptr_ >= end_))
            error("unterminated escape sequence", errc::invalid_escape);
        const char c = *ptr_++;
        char decoded;
        switch (c) {
            case '"':  decoded = '"';  break;
            case '\\': decoded = '\\'; break;
            case '/':  decoded = '/';  break;
            case 'b':  decoded = '\b'; break;
            case 'f':  decoded = '\f'; break;
            case 'n':  decoded = '\n'; break;
            case 'r':  decoded = '\r'; break;
            case 't':  decoded = '\t'; break;
            case 'u':
                scan_unicode_escape(out);
                return;
            default:
                --ptr_;
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
        if (out) out->push_back(decoded);
    }

    uint32_t scan_hex4() {
        if (LAZYJSON_UNLIKELY(end_ - ptr_ < 4))
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const int nib = hex_value(ptr_[i]);
            if (LAZYJSON_UNLIKELY(nib < 0))
                error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | static_cast<uint32_t>(nib);
        }
        ptr_ += 4;
        return val;
    }

    void scan_unicode_escape(std::string* out) {
        uint32_t cp = scan_hex4();

        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (LAZYJSON_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u'))
                error("missing low surrogate", errc::invalid_unicode_escape);
            ptr_ += 2;
            const uint32_t low = scan_hex4();
            if (LAZYJSON_UNLIKELY(low < 0xDC00 || low > 0xDFFF))
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (LAZYJSON_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }

        if (out) utf8::encode(cp, *out);
    }

    const char* begin_;
    const char* ptr_;
    const char* end_;
    size_t depth_ = 0;
};

} // namespace lazyjson::detail
