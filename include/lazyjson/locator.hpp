#pragma once

/// @file locator.hpp
/// @brief Follow a JSON Pointer through unparsed bytes.
///
/// find() walks the bytes token by token and returns a view of the target
/// value, without building any intermediate structure. Members are matched
/// on their decoded keys; when a key repeats, the last occurrence wins, as
/// it does for decode().

#include "detail/scanner.hpp"
#include "error.hpp"
#include "pointer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lazyjson {

namespace detail {

/// Scan the object at the cursor for @p key; returns the last matching
/// member value, leaving the cursor after the object.
inline std::optional<std::string_view> find_member(Scanner& scanner, const std::string& key) {
    std::optional<std::string_view> found;
    if (scanner.open_container('{', '}')) return found;
    std::string name;
    do {
        name.clear();
        scanner.read_key(&name);
        scanner.skip_whitespace();
        const char* start = scanner.position();
        scanner.skip_value();
        if (name == key)
            found = std::string_view(start, static_cast<size_t>(scanner.position() - start));
    } while (scanner.next_element('}'));
    return found;
}

/// Scan the array at the cursor up to element @p index.
inline std::optional<std::string_view> find_element(Scanner& scanner, size_t index) {
    if (scanner.open_container('[', ']')) return std::nullopt;
    size_t i = 0;
    do {
        scanner.skip_whitespace();
        const char* start = scanner.position();
        scanner.skip_value();
        if (i == index)
            return std::string_view(start, static_cast<size_t>(scanner.position() - start));
        ++i;
    } while (scanner.next_element(']'));
    return std::nullopt;
}

} // namespace detail

/// @brief Locate @p pointer inside @p bytes.
/// @return A view into @p bytes covering exactly the target value, or
///         std::nullopt when a member or element along the way is missing.
/// @throws PointerError  a token steps into a scalar (errc::not_a_container),
///                       or an array token is not a canonical index
///                       (errc::invalid_array_index).
/// @throws ParseError    malformed bytes on the way.
[[nodiscard]] inline std::optional<std::string_view> find(std::string_view bytes,
                                                          const Pointer& pointer) {
    std::string_view current = bytes;
    if (pointer.empty()) {
        detail::Scanner scanner(current);
        scanner.skip_whitespace();
        const char* start = scanner.position();
        scanner.skip_value();
        return std::string_view(start, static_cast<size_t>(scanner.position() - start));
    }

    for (const auto& token : pointer.tokens()) {
        detail::Scanner scanner(current);
        std::optional<std::string_view> next;
        switch (scanner.peek()) {
            case '{':
                next = detail::find_member(scanner, token);
                break;
            case '[': {
                const auto index = Pointer::parse_index(token);
                if (!index)
                    throw PointerError("invalid array index \"" + token + "\"",
                                       errc::invalid_array_index);
                next = detail::find_element(scanner, *index);
                break;
            }
            default:
                // Malformed bytes report as such before the type mismatch.
                scanner.skip_value();
                throw PointerError("cannot step into a scalar with token \"" + token + "\"",
                                   errc::not_a_container);
        }
        if (!next) return std::nullopt;
        current = *next;
    }
    return current;
}

/// @brief find() with the pointer given in RFC 6901 text form.
[[nodiscard]] inline std::optional<std::string_view> find(std::string_view bytes,
                                                          std::string_view pointer) {
    return find(bytes, Pointer(pointer));
}

} // namespace lazyjson
