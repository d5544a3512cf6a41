#include "notwords/quantizer.hpp"
#include "notwords/error.hpp"

#include <cmath>
#include <string>

namespace notwords {

namespace {

void check_precision(uint32_t bit_precision, const char* func) {
    if (bit_precision < CoordinateQuantizer::MIN_BITS || bit_precision > CoordinateQuantizer::MAX_BITS) {
        throw NotwordsException(ErrorCode::INVALID_ARGUMENT,
                                "Unsupported bit precision " + std::to_string(bit_precision),
                                func);
    }
}

// Map a value in [lo, hi] onto [0, 2^bits - 1]; the upper bound lands in the last cell
uint64_t quantize_axis(double value, double lo, double hi, uint32_t bits) noexcept {
    const double cells = std::ldexp(1.0, static_cast<int>(bits));
    const double normalized = (value - lo) / (hi - lo);
    const double scaled = std::floor(normalized * cells);
    const uint64_t max_cell = (uint64_t{1} << bits) - 1;

    if (scaled <= 0.0) return 0;
    if (scaled >= static_cast<double>(max_cell)) return max_cell;
    return static_cast<uint64_t>(scaled);
}

double dequantize_axis(uint64_t cell, double lo, double hi, uint32_t bits) noexcept {
    const double cells = std::ldexp(1.0, static_cast<int>(bits));
    return lo + (static_cast<double>(cell) + 0.5) / cells * (hi - lo);
}

} // anonymous namespace

CellIndex CoordinateQuantizer::interleave(uint64_t lon_cell, uint64_t lat_cell,
                                          uint32_t bit_precision) noexcept {
    uint32_t lon_pos = longitude_bits(bit_precision);
    uint32_t lat_pos = latitude_bits(bit_precision);

    CellIndex cell = 0;
    for (uint32_t i = 0; i < bit_precision; ++i) {
        cell <<= 1;
        if ((i & 1u) == 0) {
            cell |= (lon_cell >> --lon_pos) & 1u;
        } else {
            cell |= (lat_cell >> --lat_pos) & 1u;
        }
    }
    return cell;
}

void CoordinateQuantizer::deinterleave(CellIndex cell, uint32_t bit_precision,
                                       uint64_t& lon_cell, uint64_t& lat_cell) noexcept {
    lon_cell = 0;
    lat_cell = 0;
    for (uint32_t i = 0; i < bit_precision; ++i) {
        const uint64_t bit = (cell >> (bit_precision - 1 - i)) & 1u;
        if ((i & 1u) == 0) {
            lon_cell = (lon_cell << 1) | bit;
        } else {
            lat_cell = (lat_cell << 1) | bit;
        }
    }
}

CellIndex CoordinateQuantizer::to_cell(const Coordinate& coord, uint32_t bit_precision) {
    check_precision(bit_precision, __func__);

    if (!std::isfinite(coord.latitude) || !std::isfinite(coord.longitude)) {
        throw MalformedCoordinateError("Coordinate components must be finite numbers", __func__);
    }
    if (coord.latitude < MIN_LATITUDE || coord.latitude > MAX_LATITUDE) {
        throw OutOfRangeError("Latitude " + std::to_string(coord.latitude) +
                              " outside [-90, 90]", __func__);
    }
    if (coord.longitude < MIN_LONGITUDE || coord.longitude > MAX_LONGITUDE) {
        throw OutOfRangeError("Longitude " + std::to_string(coord.longitude) +
                              " outside [-180, 180]", __func__);
    }

    const uint64_t lon_cell = quantize_axis(coord.longitude, MIN_LONGITUDE, MAX_LONGITUDE,
                                            longitude_bits(bit_precision));
    const uint64_t lat_cell = quantize_axis(coord.latitude, MIN_LATITUDE, MAX_LATITUDE,
                                            latitude_bits(bit_precision));
    return interleave(lon_cell, lat_cell, bit_precision);
}

Coordinate CoordinateQuantizer::from_cell(CellIndex cell, uint32_t bit_precision) {
    check_precision(bit_precision, __func__);
    NOTWORDS_CHECK_ARGUMENT((cell >> bit_precision) == 0,
                            "Cell index wider than " + std::to_string(bit_precision) + " bits");

    uint64_t lon_cell = 0;
    uint64_t lat_cell = 0;
    deinterleave(cell, bit_precision, lon_cell, lat_cell);

    return Coordinate(
        dequantize_axis(lat_cell, MIN_LATITUDE, MAX_LATITUDE, latitude_bits(bit_precision)),
        dequantize_axis(lon_cell, MIN_LONGITUDE, MAX_LONGITUDE, longitude_bits(bit_precision)));
}

Coordinate CoordinateQuantizer::cell_half_extent(uint32_t bit_precision) noexcept {
    const int lat_bits = static_cast<int>(latitude_bits(bit_precision));
    const int lon_bits = static_cast<int>(longitude_bits(bit_precision));
    return Coordinate(std::ldexp(MAX_LATITUDE - MIN_LATITUDE, -lat_bits) / 2.0,
                      std::ldexp(MAX_LONGITUDE - MIN_LONGITUDE, -lon_bits) / 2.0);
}

} // namespace notwords
