#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace langlint {

/**
 * 64-bit FNV-1a hashing, stable across runs and platforms.
 */
class Fnv1a {
public:
    static constexpr uint64_t OFFSET_BASIS = 0xcbf29ce484222325ULL;
    static constexpr uint64_t PRIME = 0x100000001b3ULL;

    static uint64_t compute(std::string_view data);

    /**
     * Fold more data into a running hash.
     */
    static uint64_t update(uint64_t hash, const uint8_t* data, size_t len);
    static uint64_t update(uint64_t hash, std::string_view data);

    // Zero-padded 16-digit lowercase hex
    static std::string to_hex(uint64_t hash);
};

}  // namespace langlint
