#pragma once

/// @file scanner.hpp
/// @brief Validating raw JSON scanner feeding RawMap construction.
///
/// The scanner walks strict RFC 8259 JSON without building values. For the
/// top-level object it hands each member to a sink as (key, RawValue) in
/// source order; nested values are only validated and captured as exact
/// source spans.
///
/// Features:
///   - SIMD-accelerated whitespace skipping and string scanning
///   - Keys without escapes are zero-copy views into the input
///   - Escaped keys are decoded once, directly into arena memory
///   - Recursion depth limiting to protect against stack overflow
///   - UTF-8 validation of string contents (ParseOptions::validate_utf8)
///   - Errors carry errc + line/column/offset

#include "arena.hpp"
#include "config.hpp"
#include "detail/simd.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "raw_value.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>

namespace rawmap {
namespace detail {

class Scanner {
public:
    /// @brief Enumerate the members of the JSON object spanning `text`.
    ///
    /// `text` must outlive the produced views (RawMap copies it into the
    /// arena first). `sink(key, value)` is called once per member in source
    /// order and returns true when the key was not seen before.
    /// @throws ParseError on any syntax error, on a non-object input, or on
    ///         a repeated key when duplicates are disallowed.
    template <typename Sink>
    static void scan_object(std::string_view text, MonotonicArena& arena,
                            const ParseOptions& opts, Sink&& sink) {
        Scanner s(text, opts, &arena);
        s.skip_whitespace();
        if (RAWMAP_UNLIKELY(s.ptr_ >= s.end_)) s.error_unexpected_end();
        if (RAWMAP_UNLIKELY(*s.ptr_ != '{')) {
            s.error("expected '{' at start of object", errc::expected_object);
        }
        s.walk_object(sink);
        s.expect_end();
    }

    /// @brief Validate `text` as exactly one JSON value and return the
    /// value's span without surrounding whitespace.
    static RawValue scan_value(std::string_view text, const ParseOptions& opts) {
        Scanner s(text, opts, nullptr);
        RawValue v = s.capture_value();
        s.expect_end();
        return v;
    }

    /// @brief Guess the member count of a large object from its first bytes.
    ///
    /// Counts top-level commas in the first 512 bytes. Returns 0 for inputs
    /// under 256 bytes, where growing the map is cheaper than the pre-scan.
    static size_t estimate_members(std::string_view text) noexcept {
        if (text.size() <= 256) return 0;
        const char* end = text.data() + text.size();
        const char* p = simd::skip_whitespace(text.data(), end);
        if (p >= end || *p != '{') return 0;
        ++p;
        const size_t remaining = static_cast<size_t>(end - p);
        if (remaining <= 256) return 0;

        size_t est = 1;
        int depth = 0;
        const size_t scan_max = remaining < 512 ? remaining : 512;
        for (size_t i = 0; i < scan_max; ++i) {
            char ch = p[i];
            if (ch == '{' || ch == '[') ++depth;
            else if (ch == '}' || ch == ']') {
                if (depth == 0) break;
                --depth;
            }
            else if (ch == ',' && depth == 0) ++est;
            else if (ch == '"') {
                for (++i; i < scan_max && p[i] != '"'; ++i) {
                    if (p[i] == '\\') ++i;
                }
            }
        }
        return est;
    }

private:
    /// Sink for nested objects: members are validated, nothing is reported.
    struct Discard {};

    const char* ptr_;
    const char* end_;
    const char* begin_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;
    MonotonicArena* arena_;  ///< Destination for decoded keys; null for scan_value

    Scanner(std::string_view text, const ParseOptions& opts,
            MonotonicArena* arena) noexcept
        : ptr_(text.data()), end_(text.data() + text.size()), begin_(text.data())
        , opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : RAWMAP_MAX_DEPTH)
        , arena_(arena) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location_of(const char* where) const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(where - begin_);
        for (const char* p = begin_; p < where; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] RAWMAP_NOINLINE void error_at(const char* where, const std::string& msg,
                                               errc code) const {
        throw ParseError(msg, location_of(where), code);
    }

    [[noreturn]] RAWMAP_NOINLINE void error(const std::string& msg,
                                            errc code = errc::unexpected_character) const {
        error_at(ptr_, msg, code);
    }

    [[noreturn]] RAWMAP_NOINLINE void error_unexpected_end() const {
        error("unexpected end of input", errc::unexpected_end_of_input);
    }

    [[noreturn]] RAWMAP_NOINLINE void error_unexpected_char() const {
        if (ptr_ >= end_) error_unexpected_end();
        error(std::string("unexpected character '") + *ptr_ + "'");
    }

    // ─── Depth tracking ───────────────────────────────────────────────────

    void push_depth() {
        if (RAWMAP_UNLIKELY(++depth_ > max_depth_)) {
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Character reading ────────────────────────────────────────────────

    void skip_whitespace() noexcept {
        if (RAWMAP_LIKELY(ptr_ >= end_ || static_cast<unsigned char>(*ptr_) > ' ')) {
            return;
        }
        ptr_ = simd::skip_whitespace(ptr_, end_);
    }

    void expect(char c) {
        if (RAWMAP_LIKELY(ptr_ < end_ && *ptr_ == c)) {
            ++ptr_;
            return;
        }
        if (ptr_ >= end_) error_unexpected_end();
        error(std::string("expected '") + c + "', got '" + *ptr_ + "'");
    }

    void expect_end() {
        skip_whitespace();
        if (RAWMAP_UNLIKELY(ptr_ < end_)) {
            error("unexpected trailing content", errc::trailing_content);
        }
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        if (RAWMAP_UNLIKELY(static_cast<size_t>(end_ - ptr_) < len) ||
            RAWMAP_UNLIKELY(std::memcmp(ptr_, literal, len) != 0)) {
            error(std::string("expected '") + literal + "'", errc::invalid_literal);
        }
        ptr_ += len;
    }

    static bool is_digit(char c) noexcept {
        return static_cast<unsigned>(c - '0') <= 9u;
    }

    // ─── Values ───────────────────────────────────────────────────────────

    RawValue capture_value() {
        skip_whitespace();
        const char* start = ptr_;
        skip_value();
        return RawValue::from_trusted(
            std::string_view(start, static_cast<size_t>(ptr_ - start)));
    }

    void skip_value() {
        if (RAWMAP_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

        switch (*ptr_) {
            case '"': skip_string(); return;
            case '{': {
                Discard discard;
                walk_object(discard);
                return;
            }
            case '[': skip_array(); return;
            case 't': expect_literal("true"); return;
            case 'f': expect_literal("false"); return;
            case 'n': expect_literal("null"); return;
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                skip_number();
                return;
            default:
                error_unexpected_char();
        }
    }

    void skip_digits() noexcept {
        while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
    }

    void skip_number() {
        if (*ptr_ == '-') ++ptr_;
        if (RAWMAP_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_))) {
            error("invalid number", errc::invalid_number);
        }
        if (*ptr_ == '0') {
            ++ptr_;
            if (RAWMAP_UNLIKELY(ptr_ < end_ && is_digit(*ptr_))) {
                error("leading zeros are not allowed", errc::invalid_number);
            }
        } else {
            skip_digits();
        }

        if (ptr_ < end_ && *ptr_ == '.') {
            ++ptr_;
            if (RAWMAP_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_))) {
                error("expected digit after decimal point", errc::invalid_number);
            }
            skip_digits();
        }

        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (RAWMAP_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_))) {
                error("expected digit in exponent", errc::invalid_number);
            }
            skip_digits();
        }
    }

    // ─── Strings ──────────────────────────────────────────────────────────

    /// @brief Validate a string starting at its opening quote.
    /// @return true if the body contains escape sequences.
    bool skip_string() {
        ++ptr_;
        bool escaped = false;
        for (;;) {
            ptr_ = simd::find_string_special(ptr_, end_);
            if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
                error("unterminated string", errc::unterminated_string);
            }

            const auto c = static_cast<unsigned char>(*ptr_);
            if (RAWMAP_LIKELY(c == '"')) {
                ++ptr_;
                return escaped;
            }
            if (c == '\\') {
                escaped = true;
                skip_escape();
            } else if (c < 0x20) {
                error("unescaped control character in string", errc::control_character);
            } else if (opts_.validate_utf8) {
                unsigned n = utf8::validate_sequence(ptr_, end_);
                if (RAWMAP_UNLIKELY(n == 0)) {
                    error("invalid UTF-8 sequence in string", errc::invalid_utf8);
                }
                ptr_ += n;
            } else {
                ++ptr_;
            }
        }
    }

    void skip_escape() {
        ++ptr_;
        if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
            error("unterminated escape sequence", errc::invalid_escape);
        }
        switch (*ptr_) {
            case '"': case '\\': case '/':
            case 'b': case 'f': case 'n': case 'r': case 't':
                ++ptr_;
                return;
            case 'u':
                ++ptr_;
                read_unicode_escape();
                return;
            default:
                error(std::string("invalid escape '\\") + *ptr_ + "'", errc::invalid_escape);
        }
    }

    static uint8_t hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        return 0xFF;
    }

    uint32_t parse_hex4() {
        if (RAWMAP_UNLIKELY(end_ - ptr_ < 4)) {
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        }
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            uint8_t nib = hex_value(ptr_[i]);
            if (RAWMAP_UNLIKELY(nib > 15)) {
                error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            }
            val = (val << 4) | nib;
        }
        ptr_ += 4;
        return val;
    }

    /// @brief Read the XXXX of a \uXXXX escape (ptr_ just past the 'u'),
    /// joining surrogate pairs.
    uint32_t read_unicode_escape() {
        uint32_t cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (RAWMAP_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u')) {
                error("missing low surrogate", errc::invalid_unicode_escape);
            }
            ptr_ += 2;
            uint32_t low = parse_hex4();
            if (RAWMAP_UNLIKELY(low < 0xDC00 || low > 0xDFFF)) {
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            }
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (RAWMAP_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }
        return cp;
    }

    /// @brief Scan an object key and return its decoded text.
    std::string_view scan_key() {
        const char* body = ptr_ + 1;
        const bool escaped = skip_string();
        const char* body_end = ptr_ - 1;
        if (RAWMAP_LIKELY(!escaped)) {
            return std::string_view(body, static_cast<size_t>(body_end - body));
        }
        return decode_key(body, body_end);
    }

    /// @brief Decode an already validated key body into the arena.
    /// Decoding never grows the text, so the body length bounds the output.
    RAWMAP_NOINLINE std::string_view decode_key(const char* body, const char* body_end) {
        const size_t cap = static_cast<size_t>(body_end - body);
        auto* out = static_cast<char*>(arena_->allocate(cap, 1));
        if (RAWMAP_UNLIKELY(!out)) throw std::bad_alloc();

        const char* resume = ptr_;
        size_t n = 0;
        ptr_ = body;
        while (ptr_ < body_end) {
            if (*ptr_ != '\\') {
                out[n++] = *ptr_++;
                continue;
            }
            ++ptr_;
            const char c = *ptr_++;
            switch (c) {
                case 'b': out[n++] = '\b'; break;
                case 'f': out[n++] = '\f'; break;
                case 'n': out[n++] = '\n'; break;
                case 'r': out[n++] = '\r'; break;
                case 't': out[n++] = '\t'; break;
                case 'u': n += utf8::encode(read_unicode_escape(), out + n); break;
                default:  out[n++] = c; break;  // '"', '\\', '/'
            }
        }
        ptr_ = resume;
        return std::string_view(out, n);
    }

    // ─── Containers ───────────────────────────────────────────────────────

    void skip_array() {
        ++ptr_;
        push_depth();
        skip_whitespace();

        if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
            error("unterminated array", errc::unterminated_array);
        }
        if (*ptr_ == ']') {
            ++ptr_;
            pop_depth();
            return;
        }

        for (;;) {
            skip_whitespace();
            skip_value();
            skip_whitespace();

            if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
                error("unterminated array", errc::unterminated_array);
            }
            if (*ptr_ == ',') {
                ++ptr_;
                continue;
            }
            if (RAWMAP_LIKELY(*ptr_ == ']')) {
                ++ptr_;
                pop_depth();
                return;
            }
            error("expected ',' or ']' in array");
        }
    }

    /// @brief Walk an object starting at its '{'.
    ///
    /// With a real sink (top level) every member is reported; with Discard
    /// (nested objects) members are only validated.
    template <typename Sink>
    void walk_object(Sink& sink) {
        ++ptr_;
        push_depth();
        skip_whitespace();

        if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
            error("unterminated object", errc::unterminated_object);
        }
        if (*ptr_ == '}') {
            ++ptr_;
            pop_depth();
            return;
        }

        for (;;) {
            skip_whitespace();
            if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
                error("unterminated object", errc::unterminated_object);
            }
            if (RAWMAP_UNLIKELY(*ptr_ != '"')) {
                error("expected string key in object");
            }

            if constexpr (std::is_same_v<Sink, Discard>) {
                skip_string();
                skip_whitespace();
                expect(':');
                skip_whitespace();
                skip_value();
            } else {
                const char* key_pos = ptr_;
                std::string_view key = scan_key();
                skip_whitespace();
                expect(':');
                RawValue value = capture_value();
                const bool fresh = sink(key, value);
                if (RAWMAP_UNLIKELY(!fresh && !opts_.allow_duplicate_keys)) {
                    error_at(key_pos, "duplicate key: \"" + std::string(key) + "\"",
                             errc::duplicate_key);
                }
            }

            skip_whitespace();
            if (RAWMAP_UNLIKELY(ptr_ >= end_)) {
                error("unterminated object", errc::unterminated_object);
            }
            if (*ptr_ == ',') {
                ++ptr_;
                continue;
            }
            if (RAWMAP_LIKELY(*ptr_ == '}')) {
                ++ptr_;
                pop_depth();
                return;
            }
            error("expected ',' or '}' in object");
        }
    }
};

} // namespace detail

inline RawValue RawValue::from_json(std::string_view text, MonotonicArena& arena,
                                    const ParseOptions& opts) {
    const RawValue checked = detail::Scanner::scan_value(text, opts);
    return RawValue(arena.copy_string(checked.get()));
}

} // namespace rawmap
