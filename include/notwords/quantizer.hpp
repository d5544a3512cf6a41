#pragma once

#include "notwords/types.hpp"

namespace notwords {

/**
 * Coordinate Quantizer
 *
 * Maps a (latitude, longitude) pair onto a regular 2^lon_bits x 2^lat_bits
 * grid and interleaves the two per-axis cell numbers into one CellIndex,
 * geohash style: most significant bit first, longitude first, alternating.
 * With an odd bit precision longitude (the wider axis) gets the extra bit.
 *
 * Decoding returns the center of the cell, never the original point.
 */
class CoordinateQuantizer {
public:
    static constexpr uint32_t MIN_BITS = 2;
    static constexpr uint32_t MAX_BITS = 62;

    static constexpr uint32_t longitude_bits(uint32_t bit_precision) noexcept {
        return (bit_precision + 1) / 2;
    }

    static constexpr uint32_t latitude_bits(uint32_t bit_precision) noexcept {
        return bit_precision / 2;
    }

    /**
     * Quantize a coordinate
     * @throws NotwordsException OUT_OF_RANGE outside [-90,90] x [-180,180],
     *         MALFORMED_COORDINATE_TEXT for NaN or infinite components,
     *         INVALID_ARGUMENT for a precision outside [MIN_BITS, MAX_BITS]
     */
    static CellIndex to_cell(const Coordinate& coord, uint32_t bit_precision);

    /**
     * Center of the cell
     * @throws NotwordsException INVALID_ARGUMENT if the precision is unsupported
     *         or the cell has bits above bit_precision
     */
    static Coordinate from_cell(CellIndex cell, uint32_t bit_precision);

    // Half the cell extent in degrees: (latitude, longitude)
    static Coordinate cell_half_extent(uint32_t bit_precision) noexcept;

    // Bit interleaving (public for tests and tooling)
    static CellIndex interleave(uint64_t lon_cell, uint64_t lat_cell, uint32_t bit_precision) noexcept;
    static void deinterleave(CellIndex cell, uint32_t bit_precision,
                             uint64_t& lon_cell, uint64_t& lat_cell) noexcept;
};

} // namespace notwords
