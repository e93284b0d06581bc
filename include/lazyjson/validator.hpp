#pragma once

/// @file validator.hpp
/// @brief Grammar validation and top-level kind classification of raw bytes.

#include "detail/scanner.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <string_view>
#include <system_error>

namespace lazyjson {

/// @brief Throws ParseError unless @p bytes hold exactly one JSON value,
/// optionally surrounded by whitespace.
inline void check(std::string_view bytes) {
    detail::Scanner scanner(bytes);
    scanner.skip_value();
    scanner.finish();
}

/// @brief Exception-free check(): an empty error_code for valid JSON,
/// otherwise the syntax error.
[[nodiscard]] inline std::error_code validate(std::string_view bytes) {
    try {
        check(bytes);
    } catch (const ParseError& e) {
        return e.code();
    }
    return {};
}

/// @brief Kind of @p bytes that are already known to be valid JSON, taken
/// from their first significant byte.
[[nodiscard]] inline Kind classify_valid(std::string_view bytes) {
    for (const char c : bytes) {
        switch (c) {
            case '{': return Kind::Object;
            case '[': return Kind::Array;
            case '"': return Kind::String;
            case 't':
            case 'f': return Kind::Boolean;
            case 'n': return Kind::Null;
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return Kind::Number;
            default: break;
        }
    }
    throw InvariantError("validated JSON has no significant byte");
}

/// @brief Top-level kind of @p bytes, NotJson when they fail validation.
[[nodiscard]] inline Kind classify(std::string_view bytes) {
    if (validate(bytes)) return Kind::NotJson;
    return classify_valid(bytes);
}

} // namespace lazyjson
