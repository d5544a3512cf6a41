#pragma once

#include "notwords/types.hpp"
#include <string_view>

namespace notwords {

/**
 * Key Transform
 *
 * XORs a cell index with the low bit-precision bits of a keystream derived
 * from the key with BLAKE3 in key-derivation mode. XOR is self-inverse, so
 * apply() and invert() are the same bijection on [0, 2^bit_precision).
 *
 * The empty key is the identity transform: an unkeyed codec behaves like a
 * plain geohash-to-words mapping.
 *
 * This is an obfuscation, not encryption: with one known (coordinate, words)
 * pair the masked bits are recovered directly, and a small key space can be
 * brute-forced offline.
 */
class KeyTransform {
public:
    // Domain-separation context for the keystream derivation
    static constexpr std::string_view KEYSTREAM_CONTEXT = "notwords 2024-01-01 cell keystream v1";

    // Identity transform
    KeyTransform() noexcept : keystream_(0) {}

    // Derives the keystream once; the key itself is not retained
    explicit KeyTransform(std::string_view key) noexcept;

    bool is_identity() const noexcept { return keystream_ == 0; }

    CellIndex apply(CellIndex cell, uint32_t bit_precision) const;
    CellIndex invert(CellIndex transformed, uint32_t bit_precision) const;

    // Stateless forms
    static CellIndex apply(CellIndex cell, std::string_view key, uint32_t bit_precision);
    static CellIndex invert(CellIndex transformed, std::string_view key, uint32_t bit_precision);

    // 64-bit keystream word for a key; 0 for the empty key
    static uint64_t keystream(std::string_view key) noexcept;

private:
    uint64_t keystream_;
};

} // namespace notwords
