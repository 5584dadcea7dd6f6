#pragma once

/// @file parse_options.hpp
/// @brief Options for building a RawMap from JSON text.
///
/// Raw values are kept verbatim and re-emitted unchanged, so the scanner only
/// accepts strict RFC 8259 JSON: any extension accepted here would leak into
/// the serialized output. The options control limits and key policy instead.

#include <cstddef>

namespace rawmap {

struct ParseOptions {
    /// Duplicate keys in the top-level object: when true the last value wins
    /// and the key keeps the position of its first occurrence; when false
    /// the second occurrence raises errc::duplicate_key.
    bool allow_duplicate_keys = true;

    /// Reject strings containing malformed UTF-8 (overlong forms,
    /// surrogates, truncated sequences).
    bool validate_utf8 = true;

    /// Maximum nesting depth (0 = use RAWMAP_MAX_DEPTH from config.hpp).
    /// The top-level object counts as depth 1.
    size_t max_depth = 0;

    /// Defaults: duplicates collapse, UTF-8 checked.
    static constexpr ParseOptions strict() noexcept {
        return {};
    }

    /// Same as strict() but duplicate keys are an error.
    static constexpr ParseOptions unique_keys() noexcept {
        ParseOptions opts;
        opts.allow_duplicate_keys = false;
        return opts;
    }
};

} // namespace rawmap
