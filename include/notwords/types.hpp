#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace notwords {

// Latitude/longitude bounds in degrees
constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

// Geographic coordinate in degrees
struct Coordinate {
    double latitude;
    double longitude;

    constexpr Coordinate() noexcept : latitude(0.0), longitude(0.0) {}
    constexpr Coordinate(double lat, double lon) noexcept : latitude(lat), longitude(lon) {}
};

constexpr bool operator==(const Coordinate& lhs, const Coordinate& rhs) noexcept {
    return lhs.latitude == rhs.latitude && lhs.longitude == rhs.longitude;
}

constexpr bool operator!=(const Coordinate& lhs, const Coordinate& rhs) noexcept {
    return !(lhs == rhs);
}

// Interleaved grid cell identifier; only the low bit-precision bits are used
using CellIndex = uint64_t;

// Ordered words of an address, most significant first
using WordSequence = std::vector<std::string>;

// Supported address lengths
enum class WordCount : uint32_t {
    Three = 3,
    Four = 4,
    Six = 6
};

constexpr std::array<WordCount, 3> SUPPORTED_WORD_COUNTS = {
    WordCount::Three, WordCount::Four, WordCount::Six
};

constexpr uint32_t word_count_value(WordCount count) noexcept {
    return static_cast<uint32_t>(count);
}

// Total grid bits for an address length.
// Three words carry the 45 bits of a 9-character geohash; four and six words carry 48.
constexpr uint32_t bit_precision(WordCount count) noexcept {
    switch (count) {
        case WordCount::Three: return 45;
        case WordCount::Four:  return 48;
        case WordCount::Six:   return 48;
    }
    return 0;
}

// Bits carried by one word: ceil(bit_precision / word count)
constexpr uint32_t bits_per_word(WordCount count) noexcept {
    return (bit_precision(count) + word_count_value(count) - 1) / word_count_value(count);
}

// Number of words a vocabulary for this address length uses
constexpr size_t required_radix(WordCount count) noexcept {
    return size_t{1} << bits_per_word(count);
}

// Map a raw count (CLI flag, inferred sequence length) to a WordCount.
// Throws NotwordsException(UNSUPPORTED_WORD_COUNT) for anything but 3, 4 or 6.
WordCount word_count_from_int(int value);

// WordCount whose length matches, if any
std::optional<WordCount> word_count_for_length(size_t length) noexcept;

// 256-bit BLAKE3 digest
struct Blake3Hash {
    std::array<uint8_t, 32> bytes;

    constexpr Blake3Hash() noexcept : bytes{} {}

    explicit Blake3Hash(const uint8_t* data) noexcept {
        std::memcpy(bytes.data(), data, 32);
    }

    bool operator==(const Blake3Hash& other) const noexcept {
        return bytes == other.bytes;
    }

    bool operator!=(const Blake3Hash& other) const noexcept {
        return !(*this == other);
    }

    // First 8 bytes as a little-endian integer
    uint64_t low_u64() const noexcept {
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | bytes[static_cast<size_t>(i)];
        }
        return v;
    }

    std::string to_hex() const {
        static const char hex[] = "0123456789abcdef";
        std::string result;
        result.reserve(64);
        for (uint8_t b : bytes) {
            result += hex[b >> 4];
            result += hex[b & 0x0F];
        }
        return result;
    }
};

} // namespace notwords
