#include "notwords/codec.hpp"
#include "notwords/error.hpp"
#include "notwords/key_transform.hpp"
#include "notwords/parsing.hpp"
#include "notwords/quantizer.hpp"

#include <string>

namespace notwords {

Codec::Codec(Vocabulary vocabulary)
    : vocabulary_(std::move(vocabulary))
    , codecs_{WordCodec(vocabulary_.wordlist(WordCount::Three)),
              WordCodec(vocabulary_.wordlist(WordCount::Four)),
              WordCodec(vocabulary_.wordlist(WordCount::Six))}
{}

const WordCodec& Codec::word_codec(WordCount count) const {
    switch (count) {
        case WordCount::Three: return codecs_[0];
        case WordCount::Four:  return codecs_[1];
        case WordCount::Six:   return codecs_[2];
    }
    throw NotwordsException(ErrorCode::UNSUPPORTED_WORD_COUNT,
                            "Unsupported word count " + std::to_string(word_count_value(count)),
                            __func__);
}

WordSequence Codec::encode(const Coordinate& coord, std::string_view key, WordCount count) const {
    const WordCodec& words = word_codec(count);
    const uint32_t bits = bit_precision(count);

    const CellIndex cell = CoordinateQuantizer::to_cell(coord, bits);
    const CellIndex visible = KeyTransform(key).apply(cell, bits);
    return words.to_words(visible, count);
}

WordSequence Codec::encode(const Coordinate& coord, WordCount count) const {
    return encode(coord, std::string_view{}, count);
}

Coordinate Codec::decode(const WordSequence& words, std::string_view key) const {
    const auto inferred = word_count_for_length(words.size());
    if (!inferred) {
        throw NotwordsException(ErrorCode::WRONG_WORD_COUNT,
                                "Cannot decode a sequence of " + std::to_string(words.size()) + " words",
                                __func__, "Addresses have 3, 4 or 6 words");
    }
    const WordCount count = *inferred;
    const uint32_t bits = bit_precision(count);

    const uint64_t visible = word_codec(count).to_index(words);
    if ((visible >> bits) != 0) {
        NOTWORDS_THROW(ErrorCode::INDEX_OUT_OF_RANGE,
                       "Decoded index exceeds " + std::to_string(bits) + " bits");
    }

    const CellIndex cell = KeyTransform(key).invert(visible, bits);
    return CoordinateQuantizer::from_cell(cell, bits);
}

std::string Codec::encode_text(std::string_view coordinate_text, std::string_view key,
                               WordCount count) const {
    return join_words(encode(parse_coordinate(coordinate_text), key, count));
}

std::string Codec::decode_text(std::string_view words_text, std::string_view key) const {
    return format_coordinate(decode(split_words(words_text), key));
}

} // namespace notwords
