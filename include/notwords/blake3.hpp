#pragma once

#include "notwords/types.hpp"
#include <span>
#include <string_view>

namespace notwords {

/**
 * BLAKE3 hashing used to expand a secret key into a keystream.
 *
 * Only the two modes the codec needs are exposed:
 * - plain hashing (256-bit output)
 * - key derivation: a fixed, application-specific context string plus
 *   arbitrary key material, producing a 256-bit derived key
 */
class Blake3Hasher {
public:
    /**
     * Hash arbitrary data
     * @param data Input bytes
     * @return 32-byte BLAKE3 hash
     */
    static Blake3Hash hash(std::span<const uint8_t> data) noexcept;

    static Blake3Hash hash(std::string_view str) noexcept;

    /**
     * Key derivation
     * @param context Hardcoded, globally unique context string
     * @param key_material Secret input (exact bytes, no normalization)
     */
    static Blake3Hash derive_key(std::string_view context,
                                 std::span<const uint8_t> key_material) noexcept;

    static Blake3Hash derive_key(std::string_view context,
                                 std::string_view key_material) noexcept;
};

} // namespace notwords
