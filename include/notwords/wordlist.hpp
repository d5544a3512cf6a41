#pragma once

#include "notwords/types.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace notwords {

class Config;

/**
 * Immutable ordered vocabulary used as the digits of the word numbering system.
 * Lookups are exact: case and whitespace are significant.
 */
class Wordlist {
public:
    // @throws NotwordsException INVALID_WORDLIST for an empty list, an empty word or a duplicate
    explicit Wordlist(std::vector<std::string> words);

    size_t size() const noexcept { return words_.size(); }
    const std::string& at(size_t position) const { return words_.at(position); }
    const std::vector<std::string>& words() const noexcept { return words_; }

    std::optional<uint32_t> index_of(std::string_view word) const;

    // First n words (the whole list if it is shorter)
    Wordlist truncated(size_t n) const;

    /**
     * Load one word per line. Lines are trimmed and lowercased; blank lines are skipped.
     * @throws NotwordsException FILE_NOT_FOUND, INVALID_WORDLIST
     */
    static Wordlist load(const std::string& path);

    // Built-in 256-word list of short, distinct, easily spoken words
    static Wordlist human();

    // Built-in list of `size` distinct consonant-vowel words ("bafo", "kuzi", ...)
    static Wordlist syllabic(size_t size);

private:
    std::vector<std::string> words_;
    std::unordered_map<std::string, uint32_t> index_;
};

/**
 * One Wordlist per supported WordCount (lists may be shared).
 *
 * Each list is cut to exactly required_radix(n) words so that every word
 * sequence of length n decodes to a cell inside the grid. A list that is too
 * short for its WordCount (W^n < 2^B) is a fatal configuration error.
 */
class Vocabulary {
public:
    // @throws NotwordsException INDEX_OUT_OF_RANGE if a list is too short
    Vocabulary(const Wordlist& three, const Wordlist& four, const Wordlist& six);

    // Same list for every word count
    explicit Vocabulary(const Wordlist& shared);

    const Wordlist& wordlist(WordCount count) const;

    // Built-in lists: syllabic for three and four words, human for six
    static Vocabulary standard();

    // Word files from words.three / words.four / words.six, built-ins otherwise
    static Vocabulary from_config(const Config& config);

private:
    static size_t slot(WordCount count) noexcept;
    static std::shared_ptr<const Wordlist> fit(const Wordlist& list, WordCount count);

    std::array<std::shared_ptr<const Wordlist>, 3> lists_;
};

} // namespace notwords
