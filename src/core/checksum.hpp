/**
 * @file checksum.hpp
 * @brief 64-bit FNV-1a checksum used for checkpoint verification and
 *        graph fingerprints.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace hybrid_orchestrator {

inline constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
inline constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

[[nodiscard]] constexpr uint64_t fnv1a_64(std::span<const uint8_t> data,
                                          uint64_t seed = kFnvOffsetBasis) noexcept {
    uint64_t hash = seed;
    for (uint8_t byte : data) {
        hash ^= byte;
        hash *= kFnvPrime;
    }
    return hash;
}

[[nodiscard]] constexpr uint64_t fnv1a_64(std::string_view text,
                                          uint64_t seed = kFnvOffsetBasis) noexcept {
    uint64_t hash = seed;
    for (char c : text) {
        hash ^= static_cast<uint8_t>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

}  // namespace hybrid_orchestrator
