#pragma once

#include "notwords/types.hpp"
#include "notwords/word_codec.hpp"
#include "notwords/wordlist.hpp"
#include <array>
#include <string>
#include <string_view>

namespace notwords {

/**
 * Codec façade
 *
 *   encode: Coordinate -> CoordinateQuantizer -> KeyTransform::apply -> WordCodec -> words
 *   decode: words -> WordCodec -> KeyTransform::invert -> CoordinateQuantizer -> cell center
 *
 * The key is an explicit argument on every call and is never stored, so a
 * Codec is immutable after construction and safe to share between threads.
 * An empty key selects the unkeyed (identity) transform.
 */
class Codec {
public:
    explicit Codec(Vocabulary vocabulary);

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    /**
     * @throws NotwordsException OUT_OF_RANGE, MALFORMED_COORDINATE_TEXT (non-finite input),
     *         INDEX_OUT_OF_RANGE (vocabulary/precision mismatch)
     */
    WordSequence encode(const Coordinate& coord, std::string_view key, WordCount count) const;

    // Unkeyed
    WordSequence encode(const Coordinate& coord, WordCount count = WordCount::Three) const;

    /**
     * The word count is inferred from the sequence length.
     * @throws NotwordsException WRONG_WORD_COUNT, UNKNOWN_WORD, INDEX_OUT_OF_RANGE
     */
    Coordinate decode(const WordSequence& words, std::string_view key = {}) const;

    // Text forms used by the command-line tool: coordinate text in, hyphen-joined words out
    std::string encode_text(std::string_view coordinate_text, std::string_view key, WordCount count) const;
    std::string decode_text(std::string_view words_text, std::string_view key) const;

private:
    const WordCodec& word_codec(WordCount count) const;

    Vocabulary vocabulary_;
    std::array<WordCodec, 3> codecs_;
};

} // namespace notwords
