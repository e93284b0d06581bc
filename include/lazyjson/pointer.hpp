#pragma once

/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901).
///
///   ""        -> the document itself
///   "/foo"    -> member "foo"
///   "/foo/0"  -> first element of "foo"
///   "/a~1b"   -> member "a/b" (~0 = ~, ~1 = /)
///
/// Tokens are stored unescaped.

#include "error.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lazyjson {

class Pointer {
public:
    /// Empty pointer (the document itself).
    Pointer() = default;

    /// Parse an RFC 6901 string. Throws PointerError for a non-empty string
    /// that does not start with '/', or for a '~' not followed by 0 or 1.
    explicit Pointer(std::string_view text) {
        if (text.empty()) return;
        if (text[0] != '/')
            throw PointerError("JSON pointer must start with '/' or be empty: \"" +
                               std::string(text) + "\"", errc::invalid_pointer);
        text.remove_prefix(1);
        for (;;) {
            const auto pos = text.find('/');
            tokens_.push_back(unescape(text.substr(0, pos)));
            if (pos == std::string_view::npos) break;
            text.remove_prefix(pos + 1);
        }
    }

    /// One-token pointer addressing member @p token, given unescaped.
    [[nodiscard]] static Pointer from_token(std::string token) {
        Pointer p;
        p.tokens_.push_back(std::move(token));
        return p;
    }

    /// One-token pointer addressing element @p index.
    [[nodiscard]] static Pointer from_index(size_t index) {
        return from_token(std::to_string(index));
    }

    [[nodiscard]] Pointer append(std::string_view token) const {
        Pointer p(*this);
        p.tokens_.emplace_back(token);
        return p;
    }

    [[nodiscard]] Pointer append(size_t index) const {
        return append(std::to_string(index));
    }

    /// Pointer to the enclosing container (empty for the root).
    [[nodiscard]] Pointer parent() const {
        Pointer p(*this);
        if (!p.tokens_.empty()) p.tokens_.pop_back();
        return p;
    }

    [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return tokens_.size(); }

    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept {
        return tokens_;
    }

    /// Serialize back to RFC 6901 form.
    [[nodiscard]] std::string to_string() const {
        std::string result;
        for (const auto& tok : tokens_) {
            result += '/';
            result += escape(tok);
        }
        return result;
    }

    bool operator==(const Pointer& o) const { return tokens_ == o.tokens_; }
    bool operator!=(const Pointer& o) const { return tokens_ != o.tokens_; }

    // ─── Token helpers ───────────────────────────────────────────────────

    /// ~ -> ~0, / -> ~1
    static std::string escape(std::string_view s) {
        std::string result;
        result.reserve(s.size());
        for (const char c : s) {
            if (c == '~') result += "~0";
            else if (c == '/') result += "~1";
            else result += c;
        }
        return result;
    }

    /// ~1 -> /, ~0 -> ~
    static std::string unescape(std::string_view s) {
        std::string result;
        result.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] != '~') {
                result += s[i];
                continue;
            }
            const char next = i + 1 < s.size() ? s[i + 1] : '\0';
            if (next == '0') result += '~';
            else if (next == '1') result += '/';
            else throw PointerError("invalid '~' escape in JSON pointer token \"" +
                                    std::string(s) + "\"", errc::invalid_pointer);
            ++i;
        }
        return result;
    }

    /// Canonical array index: "0" or digits without a leading zero.
    [[nodiscard]] static std::optional<size_t> parse_index(std::string_view tok) noexcept {
        if (tok.empty() || (tok.size() > 1 && tok[0] == '0')) return std::nullopt;
        size_t idx = 0;
        auto [p, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), idx);
        if (ec != std::errc{} || p != tok.data() + tok.size()) return std::nullopt;
        return idx;
    }

private:
    std::vector<std::string> tokens_;
};

} // namespace lazyjson
