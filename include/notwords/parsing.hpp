#pragma once

#include "notwords/types.hpp"
#include <string>
#include <string_view>

namespace notwords {

// =============================================================================
// Coordinate text
// =============================================================================

/**
 * Parse "<lat> <lon>", "<lat>,<lon>" or "<lat>, <lon>" (surrounding whitespace allowed).
 * Range checking is left to the quantizer.
 * @throws NotwordsException MALFORMED_COORDINATE_TEXT for any other shape,
 *         a non-numeric component, or a NaN/infinite value
 */
Coordinate parse_coordinate(std::string_view text);

// "<lat>, <lon>"
std::string format_coordinate(const Coordinate& coord);

// =============================================================================
// Word address text
// =============================================================================

/**
 * Split an address on '-' or '.', trimming and lowercasing each word.
 * @throws NotwordsException WRONG_WORD_COUNT if the text or any word is empty
 */
WordSequence split_words(std::string_view text);

// Hyphen-joined display form
std::string join_words(const WordSequence& words);

constexpr char WORD_SEPARATOR = '-';

} // namespace notwords
