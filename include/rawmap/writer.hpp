#pragma once

/// @file writer.hpp
/// @brief Incremental JSON writer used to serialize raw maps.
///
/// Values inside a map are already JSON text, so the writer never formats
/// scalars: it emits structure, escaped keys and verbatim raw fragments.
///
/// Usage:
///   std::string buf;
///   rawmap::JsonWriter w(buf);
///   w.begin_object();
///   w.key("name").raw_json(R"("Alice")");
///   w.key("scores").raw_json("[100,95]");
///   w.end_object();
///   // buf == {"name":"Alice","scores":[100,95]}

#include "config.hpp"

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rawmap {

namespace detail {

/// Appends to a std::string or writes to a std::ostream.
class OutputSink {
public:
    explicit OutputSink(std::string& s) noexcept : str_(&s) {}
    explicit OutputSink(std::ostream& os) noexcept : os_(&os) {}

    void put(std::string_view s) {
        if (s.empty()) return;
        if (str_) str_->append(s.data(), s.size());
        else os_->write(s.data(), static_cast<std::streamsize>(s.size()));
    }

    void put(char c) {
        if (str_) str_->push_back(c);
        else os_->put(c);
    }

    void flush() {
        if (os_) os_->flush();
    }

private:
    std::string* str_ = nullptr;
    std::ostream* os_ = nullptr;
};

/// Escape for each byte below 0x80: 0 = verbatim, 'u' = \u00XX, else the
/// character following the backslash.
inline constexpr char escape_for(unsigned char c) noexcept {
    switch (c) {
        case '"':  return '"';
        case '\\': return '\\';
        case '\b': return 'b';
        case '\f': return 'f';
        case '\n': return 'n';
        case '\r': return 'r';
        case '\t': return 't';
        default:   return c < 0x20 ? 'u' : '\0';
    }
}

} // namespace detail

/// @brief Incremental JSON writer with structure validation and optional
/// indentation. Commas are inserted automatically.
///
/// Raw fragments are written as-is in indented mode too: a multi-line
/// fragment keeps its own layout. Structural misuse (a value without a key,
/// an unbalanced close, a second top-level value) throws std::logic_error.
class JsonWriter {
public:
    /// @param indent  Spaces per nesting level; negative means compact.
    explicit JsonWriter(std::string& out, int indent = -1) noexcept
        : sink_(out), indent_(indent) {}

    explicit JsonWriter(std::ostream& os, int indent = -1) noexcept
        : sink_(os), indent_(indent) {}

    JsonWriter(const JsonWriter&) = delete;
    JsonWriter& operator=(const JsonWriter&) = delete;
    JsonWriter(JsonWriter&&) = default;
    JsonWriter& operator=(JsonWriter&&) = default;

    /// Write pre-serialized JSON verbatim. The fragment is trusted.
    JsonWriter& raw_json(std::string_view json) {
        before_value();
        sink_.put(json);
        after_value();
        return *this;
    }

    JsonWriter& string_value(std::string_view s) {
        before_value();
        put_quoted(s);
        after_value();
        return *this;
    }

    JsonWriter& begin_object() { return open(true); }
    JsonWriter& end_object() { return close(true); }
    JsonWriter& begin_array() { return open(false); }
    JsonWriter& end_array() { return close(false); }

    JsonWriter& key(std::string_view k) {
        if (RAWMAP_UNLIKELY(frames_.empty() || !frames_.back().object ||
                            frames_.back().keyed)) {
            throw std::logic_error("JsonWriter: key() outside of object context");
        }
        Frame& f = frames_.back();
        if (f.members++ > 0) sink_.put(',');
        newline(frames_.size());
        put_quoted(k);
        sink_.put(indent_ >= 0 ? std::string_view(": ") : std::string_view(":"));
        f.keyed = true;
        return *this;
    }

    void flush() { sink_.flush(); }

    /// True once a top-level value has been written and every container is
    /// closed.
    [[nodiscard]] bool is_complete() const noexcept {
        return frames_.empty() && root_done_;
    }

    [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

private:
    struct Frame {
        bool object;
        bool keyed;  ///< object: key written, value pending
        size_t members;
    };

    detail::OutputSink sink_;
    int indent_;
    bool root_done_ = false;
    std::vector<Frame> frames_;

    JsonWriter& open(bool object) {
        before_value();
        sink_.put(object ? '{' : '[');
        frames_.push_back(Frame{object, false, 0});
        return *this;
    }

    JsonWriter& close(bool object) {
        if (RAWMAP_UNLIKELY(frames_.empty() || frames_.back().object != object ||
                            frames_.back().keyed)) {
            throw std::logic_error(object
                ? "JsonWriter: end_object() without matching begin_object()"
                : "JsonWriter: end_array() without matching begin_array()");
        }
        const bool had_members = frames_.back().members > 0;
        frames_.pop_back();
        if (had_members) newline(frames_.size());
        sink_.put(object ? '}' : ']');
        after_value();
        return *this;
    }

    void before_value() {
        if (frames_.empty()) {
            if (RAWMAP_UNLIKELY(root_done_)) {
                throw std::logic_error("JsonWriter: second top-level value");
            }
            return;
        }
        Frame& f = frames_.back();
        if (f.object) {
            if (RAWMAP_UNLIKELY(!f.keyed)) {
                throw std::logic_error("JsonWriter: value in object without key()");
            }
            return;
        }
        if (f.members++ > 0) sink_.put(',');
        newline(frames_.size());
    }

    void after_value() {
        if (frames_.empty()) {
            root_done_ = true;
        } else if (frames_.back().object) {
            frames_.back().keyed = false;
        }
    }

    void newline(size_t level) {
        if (indent_ < 0) return;
        sink_.put('\n');
        static constexpr std::string_view kSpaces =
            "                                                                ";
        size_t n = level * static_cast<size_t>(indent_);
        while (n > 0) {
            const size_t step = n < kSpaces.size() ? n : kSpaces.size();
            sink_.put(kSpaces.substr(0, step));
            n -= step;
        }
    }

    void put_quoted(std::string_view s) {
        static constexpr char kHex[] = "0123456789abcdef";
        sink_.put('"');
        size_t run = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            const auto c = static_cast<unsigned char>(s[i]);
            const char esc = c < 0x80 ? detail::escape_for(c) : 0;
            if (RAWMAP_LIKELY(esc == 0)) continue;
            sink_.put(s.substr(run, i - run));
            if (esc == 'u') {
                const char u[6] = {'\\', 'u', '0', '0', kHex[c >> 4], kHex[c & 0xF]};
                sink_.put(std::string_view(u, 6));
            } else {
                const char pair[2] = {'\\', esc};
                sink_.put(std::string_view(pair, 2));
            }
            run = i + 1;
        }
        sink_.put(s.substr(run));
        sink_.put('"');
    }
};

} // namespace rawmap
