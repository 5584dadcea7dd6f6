#pragma once

/// @file hash.hpp
/// @brief Key hash strategies for the RawMap position index.
///
/// A hash strategy is any copyable type with a const, reentrant
/// `size_t operator()(std::string_view) const`. The index only consumes the
/// hash; key equality is always byte equality against the ordered store.
///
/// Two strategies ship with the library:
///   - StringHash: fixed seed, deterministic across runs (the default)
///   - SeededStringHash: caller- or randomly-seeded, for keys that come
///     from untrusted JSON and could be chosen to collide

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <random>
#include <string_view>

namespace rawmap::detail {

/// @brief wyhash-style byte mixer tuned for short keys (4-20 bytes typical).
/// Constants from wyhash v4 (public domain, Wang Yi).
inline size_t hash_bytes(const char* data, size_t len, uint64_t seed) noexcept {
    constexpr uint64_t kMulA = 0xa0761d6478bd642fULL;
    constexpr uint64_t kMulB = 0xe7037ed1a0b428dbULL;

    uint64_t h = seed ^ (len * kMulB);

    auto mix = [&h](uint64_t a, uint64_t b) noexcept {
        h ^= a;
        h *= kMulB;
        h ^= b;
        h *= kMulA;
    };

    if (len <= 8) {
        uint64_t a = 0, b = 0;
        if (len >= 4) {
            std::memcpy(&a, data, 4);
            std::memcpy(&b, data + len - 4, 4);
        } else if (len > 0) {
            a = static_cast<uint64_t>(static_cast<unsigned char>(data[0])) << 16
              | static_cast<uint64_t>(static_cast<unsigned char>(data[len >> 1])) << 8
              | static_cast<uint64_t>(static_cast<unsigned char>(data[len - 1]));
        }
        mix(a, b);
    } else if (len <= 16) {
        uint64_t a, b;
        std::memcpy(&a, data, 8);
        std::memcpy(&b, data + len - 8, 8);
        mix(a, b);
    } else {
        const char* p = data;
        const char* const stop = data + len - 16;
        while (p <= stop) {
            uint64_t a, b;
            std::memcpy(&a, p, 8);
            std::memcpy(&b, p + 8, 8);
            mix(a, b);
            p += 16;
        }
        // Last 16 bytes, overlapping the final full chunk
        uint64_t a, b;
        std::memcpy(&a, data + len - 16, 8);
        std::memcpy(&b, data + len - 8, 8);
        mix(a, b);
    }

    h ^= h >> 32;
    h *= kMulA;
    h ^= h >> 29;
    return static_cast<size_t>(h);
}

} // namespace rawmap::detail

namespace rawmap {

/// @brief Default hash strategy: fixed seed, no per-instance state.
struct StringHash {
    static constexpr uint64_t kSeed = 0xa0761d6478bd642fULL;

    size_t operator()(std::string_view key) const noexcept {
        return detail::hash_bytes(key.data(), key.size(), kSeed);
    }
};

/// @brief Seeded hash strategy for maps built from untrusted input.
class SeededStringHash {
public:
    explicit SeededStringHash(uint64_t seed) noexcept : seed_(seed) {}

    /// @brief A strategy seeded from std::random_device.
    static SeededStringHash random() {
        std::random_device rd;
        uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
        return SeededStringHash(seed);
    }

    size_t operator()(std::string_view key) const noexcept {
        return detail::hash_bytes(key.data(), key.size(), seed_);
    }

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
};

} // namespace rawmap
