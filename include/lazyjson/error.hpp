#pragma once

/// @file error.hpp
/// @brief Error types for lazyjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, PointerError, TypeError, Undefined (default)
///   - Via error_code: lazyjson::errc enum + json_category() (exception-free)
///
/// InvariantError marks a broken internal contract. It is never caught
/// inside the library.
///
/// Use Value::try_path() / Value::try_index() for exception-free navigation.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace lazyjson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief lazyjson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Syntax errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,
    control_character       = 12,

    // Navigation errors (50-79)
    undefined               = 50,
    not_a_container         = 51,
    invalid_array_index     = 52,
    invalid_pointer         = 53,

    // Native value access (80-89)
    type_mismatch           = 80,

    // Internal contract breaches (90-99)
    invariant_violation     = 90,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "lazyjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after JSON";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::control_character:       return "unescaped control character in string";
            case errc::undefined:               return "not defined";
            case errc::not_a_container:         return "value is not a container";
            case errc::invalid_array_index:     return "invalid array index";
            case errc::invalid_pointer:         return "invalid JSON pointer";
            case errc::type_mismatch:           return "type mismatch";
            case errc::invariant_violation:     return "internal invariant violated";
            default:                            return "unknown lazyjson error";
        }
    }
};

} // namespace detail

/// @brief Get the lazyjson error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from lazyjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief Create an error_condition from lazyjson::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief True for codes in the syntax error range.
inline bool is_syntax_error(const std::error_code& ec) noexcept {
    return ec.category() == json_category() && ec.value() > 0 && ec.value() < 50;
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Syntax error in JSON bytes, with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Structural problem while following a JSON pointer through bytes
/// (indexing into a scalar, non-numeric array index, malformed pointer).
class PointerError : public std::system_error {
public:
    PointerError(const std::string& msg, errc code)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief Typed access to a NativeValue holding another kind.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief A requested member or element does not exist.
///
/// Carries the requested key when it is known. Index lookups carry none.
class Undefined : public std::system_error {
public:
    Undefined()
        : std::system_error(make_error_code(errc::undefined), "not defined") {}

    explicit Undefined(std::string path)
        : std::system_error(make_error_code(errc::undefined),
                            path.empty() ? std::string("not defined")
                                         : path + " is not defined")
        , path_(std::move(path)) {}

    /// @brief Key that was looked up (empty when unknown).
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] bool has_path() const noexcept { return !path_.empty(); }

    /// @brief The bare description, without std::system_error decoration.
    [[nodiscard]] std::string message() const {
        return path_.empty() ? std::string("not defined") : path_ + " is not defined";
    }

private:
    std::string path_;
};

/// @brief An internal contract of the library was broken.
///
/// Raised for decode failures on already validated bytes, a classifier that
/// finds no significant byte in valid JSON, or a null Value handle used as
/// input. Never caught or retried by the library.
class InvariantError : public std::logic_error {
public:
    explicit InvariantError(const std::string& msg)
        : std::logic_error("lazyjson invariant violated: " + msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = doc->try_path("name");
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace lazyjson

// Register lazyjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<lazyjson::errc> : true_type {};
} // namespace std
