#pragma once

/// @file raw_value.hpp
/// @brief RawValue, Entry and Slice: the element types of a RawMap.

#include "parse_options.hpp"

#include <cstddef>
#include <ostream>
#include <string_view>
#include <utility>

namespace rawmap {

class MonotonicArena;

/// @brief A borrowed, verbatim JSON value (any type), never decoded.
///
/// The text is exactly what appeared in the source, without surrounding
/// whitespace. A RawValue obtained from a map or from from_json() points
/// into an arena and is valid for as long as that arena is neither reset
/// nor destroyed.
class RawValue {
public:
    /// @brief Validate `text` as exactly one JSON value and copy it into the
    /// arena. Surrounding whitespace is trimmed.
    /// @throws ParseError if `text` is not a single valid JSON value.
    /// (Defined in scanner.hpp.)
    static RawValue from_json(std::string_view text, MonotonicArena& arena,
                              const ParseOptions& opts = {});

    /// @brief Wrap text the caller has already validated and whose storage
    /// outlives every use of the value. No checks are performed.
    static constexpr RawValue from_trusted(std::string_view text) noexcept {
        return RawValue(text);
    }

    /// @brief The verbatim JSON text.
    [[nodiscard]] constexpr std::string_view get() const noexcept { return text_; }

    [[nodiscard]] constexpr size_t size() const noexcept { return text_.size(); }

    friend constexpr bool operator==(RawValue a, RawValue b) noexcept {
        return a.text_ == b.text_;
    }
    friend constexpr bool operator!=(RawValue a, RawValue b) noexcept {
        return a.text_ != b.text_;
    }

    friend std::ostream& operator<<(std::ostream& os, RawValue v) {
        return os << v.text_;
    }

private:
    constexpr explicit RawValue(std::string_view text) noexcept : text_(text) {}

    std::string_view text_;
};

/// @brief One map member: key and raw value, both borrowed from the arena.
using Entry = std::pair<std::string_view, RawValue>;

/// @brief Non-owning contiguous view, the C++17 stand-in for a span.
template <typename T>
class Slice {
public:
    using value_type = T;
    using iterator = T*;
    using size_type = size_t;

    constexpr Slice() noexcept = default;
    constexpr Slice(T* data, size_t size) noexcept : data_(data), size_(size) {}

    [[nodiscard]] constexpr T* data() const noexcept { return data_; }
    [[nodiscard]] constexpr size_t size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr T& operator[](size_t i) const noexcept { return data_[i]; }

    constexpr T* begin() const noexcept { return data_; }
    constexpr T* end() const noexcept { return data_ + size_; }

private:
    T* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace rawmap
