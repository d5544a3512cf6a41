#include "notwords/key_transform.hpp"
#include "notwords/blake3.hpp"
#include "notwords/error.hpp"

#include <string>

namespace notwords {

namespace {

uint64_t precision_mask(uint32_t bit_precision, const char* func) {
    if (bit_precision == 0 || bit_precision > 64) {
        throw NotwordsException(ErrorCode::INVALID_ARGUMENT,
                                "Unsupported bit precision " + std::to_string(bit_precision),
                                func);
    }
    return bit_precision == 64 ? ~uint64_t{0} : (uint64_t{1} << bit_precision) - 1;
}

} // anonymous namespace

uint64_t KeyTransform::keystream(std::string_view key) noexcept {
    // No key: identity, not the hash of the empty string
    if (key.empty()) {
        return 0;
    }
    return Blake3Hasher::derive_key(KEYSTREAM_CONTEXT, key).low_u64();
}

KeyTransform::KeyTransform(std::string_view key) noexcept
    : keystream_(keystream(key)) {}

CellIndex KeyTransform::apply(CellIndex cell, uint32_t bit_precision) const {
    const uint64_t mask = precision_mask(bit_precision, __func__);
    NOTWORDS_CHECK_ARGUMENT((cell & ~mask) == 0,
                            "Cell index wider than " + std::to_string(bit_precision) + " bits");
    return cell ^ (keystream_ & mask);
}

CellIndex KeyTransform::invert(CellIndex transformed, uint32_t bit_precision) const {
    return apply(transformed, bit_precision);
}

CellIndex KeyTransform::apply(CellIndex cell, std::string_view key, uint32_t bit_precision) {
    return KeyTransform(key).apply(cell, bit_precision);
}

CellIndex KeyTransform::invert(CellIndex transformed, std::string_view key, uint32_t bit_precision) {
    return KeyTransform(key).invert(transformed, bit_precision);
}

} // namespace notwords
