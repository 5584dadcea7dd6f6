#pragma once

/// @file error.hpp
/// @brief Error types for rawmap: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, FrozenError, StaleArenaError (default)
///   - Via error_code: rawmap::errc enum + rawmap_category() (exception-free)
///
/// Use RawMap<>::try_from_json(input, arena) for exception-free construction.
///
/// Capacity overflow and destroying a map that a FrozenRawMap still borrows
/// are not reported: both terminate the process.

#include "config.hpp"

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace rawmap {

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

enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
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
    duplicate_key           = 12,
    invalid_utf8            = 13,
    control_character       = 14,
    expected_object         = 15,

    // Map state errors (50-79)
    map_frozen              = 50,
    stale_arena             = 51,
    view_released           = 52,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class rawmap_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "rawmap";
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
            case errc::duplicate_key:           return "duplicate key";
            case errc::invalid_utf8:            return "invalid UTF-8 encoding";
            case errc::control_character:       return "control character in string";
            case errc::expected_object:         return "expected a JSON object";
            case errc::map_frozen:              return "map is frozen";
            case errc::stale_arena:             return "backing arena was reset";
            case errc::view_released:           return "frozen view was released";
            default:                            return "unknown rawmap error";
        }
    }
};

} // namespace detail

/// @brief Get the rawmap error category singleton.
inline const std::error_category& rawmap_category() noexcept {
    static const detail::rawmap_error_category_impl instance;
    return instance;
}

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), rawmap_category()};
}

inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), rawmap_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief JSON parse error with source position information.
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

/// @brief Misuse of the frozen state: mutating or moving a map that has a
/// live FrozenRawMap, freezing it twice, or reading a released view.
class FrozenError : public std::system_error {
public:
    explicit FrozenError(const std::string& msg, errc code = errc::map_frozen)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief The arena backing a map was reset after the map was built.
class StaleArenaError : public std::system_error {
public:
    explicit StaleArenaError(const std::string& msg)
        : std::system_error(make_error_code(errc::stale_arena), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

namespace detail {

/// @brief Requested capacity exceeds what the platform can address.
[[noreturn]] RAWMAP_NOINLINE inline void capacity_overflow() noexcept {
    std::fputs("rawmap: capacity overflow\n", stderr);
    std::abort();
}

/// @brief A RawMap was destroyed while a FrozenRawMap still borrows it.
[[noreturn]] RAWMAP_NOINLINE inline void destroyed_while_frozen() noexcept {
    std::fputs("rawmap: RawMap destroyed while a FrozenRawMap is alive\n", stderr);
    std::abort();
}

} // namespace detail

} // namespace rawmap

// Register rawmap::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<rawmap::errc> : true_type {};
} // namespace std
