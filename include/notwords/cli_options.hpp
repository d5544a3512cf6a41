#pragma once

#include "notwords/codec.hpp"
#include "notwords/error.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace notwords::cli {

// =============================================================================
// Exit Codes
// =============================================================================

constexpr int EXIT_OK = 0;
constexpr int EXIT_CODEC_ERROR = 1;
constexpr int EXIT_USAGE = 2;

// =============================================================================
// Command Options
// =============================================================================

struct CodecOptions {
    std::string key;                 // empty = unkeyed
    std::optional<int> words;        // --words, if given
    std::vector<std::string> positional;
};

// "-33.8" and "-33.8,151.2" are values, not options
bool looks_like_number(const std::string& arg);

/**
 * Parse `[-k|--key KEY] [-w|--words N] [--] <positional...>`.
 * Returns false after writing the reason to err on a usage error.
 */
bool parse_codec_options(const std::vector<std::string>& args, CodecOptions& opts, std::ostream& err);

// Coordinate tokens joined with single spaces
std::string join_tokens(const std::vector<std::string>& tokens);

/**
 * An explicit --words on decode must match the address length.
 * @throws NotwordsException UNSUPPORTED_WORD_COUNT for a count other than 3, 4 or 6,
 *         WRONG_WORD_COUNT on a mismatch
 */
void check_word_count(const WordSequence& words, std::optional<int> expected);

// "Error: <Kind>: <message>..." on err; returns EXIT_CODEC_ERROR
int report_error(const NotwordsException& e, std::ostream& err);

// =============================================================================
// Command Bodies
// =============================================================================

// Prints "Encoded address: <words>"; default_words applies when --words is absent
int run_encode(const Codec& codec, const CodecOptions& opts, int default_words,
               std::ostream& out, std::ostream& err);

// Prints "Decoded coordinates: <lat>, <lon>"
int run_decode(const Codec& codec, const CodecOptions& opts,
               std::ostream& out, std::ostream& err);

} // namespace notwords::cli
