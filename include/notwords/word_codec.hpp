#pragma once

#include "notwords/types.hpp"
#include "notwords/wordlist.hpp"

namespace notwords {

/**
 * Word Codec
 *
 * Writes an integer in base W (the wordlist size) with a fixed number of
 * digits, most significant first; each digit selects a word by position.
 * toIndex(toWords(i, n)) == i for every i < W^n.
 *
 * Holds a reference: the Wordlist must outlive the codec.
 */
class WordCodec {
public:
    explicit WordCodec(const Wordlist& wordlist) noexcept : wordlist_(wordlist) {}

    // @throws NotwordsException INDEX_OUT_OF_RANGE if index >= W^n
    WordSequence to_words(uint64_t index, WordCount count) const;

    /**
     * @throws NotwordsException WRONG_WORD_COUNT if the length is not 3, 4 or 6,
     *         UNKNOWN_WORD if a word is not in the list,
     *         INDEX_OUT_OF_RANGE if the value does not fit in 64 bits
     */
    uint64_t to_index(const WordSequence& words) const;

    // min(W^n, 2^64 - 1)
    uint64_t capacity(uint32_t digits) const noexcept;


private:
    const Wordlist& wordlist_;
};

} // namespace notwords
