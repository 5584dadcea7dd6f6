#pragma once

/// @file rawmap.hpp
/// @brief Main header file for the rawmap library.

#include "config.hpp"
#include "error.hpp"
#include "arena.hpp"
#include "parse_options.hpp"
#include "raw_value.hpp"
#include "scanner.hpp"
#include "writer.hpp"
#include "raw_map.hpp"

#include <ostream>
#include <string>

namespace rawmap {

/// @brief Serialize a map to a JSON object string in insertion order.
/// @param indent  Indentation width (-1 = compact).
template <typename Hash>
[[nodiscard]] std::string to_string(const RawMap<Hash>& map, int indent = -1) {
    std::string out;
    out.reserve(2 + map.size() * 16);
    JsonWriter w(out, indent);
    map.write(w);
    return out;
}

template <typename Hash>
[[nodiscard]] std::string to_string(const FrozenRawMap<Hash>& map, int indent = -1) {
    std::string out;
    JsonWriter w(out, indent);
    map.write(w);
    return out;
}

template <typename Hash>
std::ostream& operator<<(std::ostream& os, const RawMap<Hash>& map) {
    JsonWriter w(os);
    map.write(w);
    return os;
}

template <typename Hash>
std::ostream& operator<<(std::ostream& os, const FrozenRawMap<Hash>& map) {
    JsonWriter w(os);
    map.write(w);
    return os;
}

} // namespace rawmap
