#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace doubleblind {

/**
 * @brief SHA-256 helpers used for cache keys and synthesis seeds
 */
class Digest {
public:
    using Bytes = std::array<uint8_t, 32>;

    [[nodiscard]] static Bytes sha256(std::string_view data);

    /// Lowercase hex of the full SHA-256 digest
    [[nodiscard]] static std::string sha256_hex(std::string_view data);

    /**
     * @brief Stable digest of (category, original value).
     *
     * The primitive type is part of the key, so the string "42" and the
     * integer 42 never share a cache entry.
     */
    [[nodiscard]] static std::string value_key(std::string_view category, const Scalar& value);

    /// First 8 digest bytes as a little-endian integer
    [[nodiscard]] static uint64_t seed_from(std::string_view data);
};

} // namespace doubleblind
