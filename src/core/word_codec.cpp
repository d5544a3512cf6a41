#include "notwords/word_codec.hpp"
#include "notwords/error.hpp"

#include <limits>
#include <string>

namespace notwords {

WordCount word_count_from_int(int value) {
    for (WordCount count : SUPPORTED_WORD_COUNTS) {
        if (static_cast<int>(word_count_value(count)) == value) {
            return count;
        }
    }
    throw NotwordsException(ErrorCode::UNSUPPORTED_WORD_COUNT,
                            "Unsupported word count " + std::to_string(value),
                            __func__, "Use 3, 4 or 6 words");
}

std::optional<WordCount> word_count_for_length(size_t length) noexcept {
    for (WordCount count : SUPPORTED_WORD_COUNTS) {
        if (length == word_count_value(count)) {
            return count;
        }
    }
    return std::nullopt;
}

uint64_t WordCodec::capacity(uint32_t digits) const noexcept {
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    const uint64_t radix = wordlist_.size();

    uint64_t result = 1;
    for (uint32_t i = 0; i < digits; ++i) {
        if (result > MAX / radix) {
            return MAX;
        }
        result *= radix;
    }
    return result;
}

WordSequence WordCodec::to_words(uint64_t index, WordCount count) const {
    const uint32_t digits = word_count_value(count);
    const uint64_t limit = capacity(digits);

    // A saturated capacity means W^n exceeds every 64-bit index
    if (limit != std::numeric_limits<uint64_t>::max() && index >= limit) {
        throw NotwordsException(ErrorCode::INDEX_OUT_OF_RANGE,
                                "Index " + std::to_string(index) + " needs more than " +
                                    std::to_string(digits) + " base-" +
                                    std::to_string(wordlist_.size()) + " digits",
                                __func__);
    }

    const uint64_t radix = wordlist_.size();
    WordSequence words(digits);
    for (uint32_t i = digits; i > 0; --i) {
        words[i - 1] = wordlist_.at(static_cast<size_t>(index % radix));
        index /= radix;
    }
    return words;
}

uint64_t WordCodec::to_index(const WordSequence& words) const {
    if (!word_count_for_length(words.size())) {
        throw NotwordsException(ErrorCode::WRONG_WORD_COUNT,
                                "Cannot decode a sequence of " + std::to_string(words.size()) + " words",
                                __func__, "Addresses have 3, 4 or 6 words");
    }

    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    const uint64_t radix = wordlist_.size();

    uint64_t value = 0;
    for (const auto& word : words) {
        auto position = wordlist_.index_of(word);
        if (!position) {
            throw UnknownWordError("Word '" + word + "' is not in the wordlist", __func__);
        }
        if (value > (MAX - *position) / radix) {
            NOTWORDS_THROW(ErrorCode::INDEX_OUT_OF_RANGE, "Word sequence value exceeds 64 bits");
        }
        value = value * radix + *position;
    }
    return value;
}

} // namespace notwords
