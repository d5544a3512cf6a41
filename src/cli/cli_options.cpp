#include "notwords/cli_options.hpp"
#include "notwords/logging.hpp"
#include "notwords/parsing.hpp"

#include <cctype>
#include <stdexcept>

namespace notwords::cli {

bool looks_like_number(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-' &&
           (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
}

bool parse_codec_options(const std::vector<std::string>& args, CodecOptions& opts, std::ostream& err) {
    bool options_done = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_done || arg.empty() || arg[0] != '-' || looks_like_number(arg)) {
            opts.positional.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if ((arg == "-k" || arg == "--key") && i + 1 < args.size()) {
            opts.key = args[++i];
        } else if ((arg == "-w" || arg == "--words") && i + 1 < args.size()) {
            const std::string& value = args[++i];
            try {
                size_t consumed = 0;
                int n = std::stoi(value, &consumed);
                if (consumed != value.size()) throw std::invalid_argument(value);
                opts.words = n;
            } catch (const std::exception&) {
                err << "Invalid --words value: " << value << " (expected 3, 4 or 6)\n";
                return false;
            }
        } else {
            err << "Unknown or incomplete option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string result;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) result += ' ';
        result += tokens[i];
    }
    return result;
}

void check_word_count(const WordSequence& words, std::optional<int> expected) {
    if (!expected) return;

    const WordCount count = word_count_from_int(*expected);
    if (words.size() != word_count_value(count)) {
        throw NotwordsException(ErrorCode::WRONG_WORD_COUNT,
                                "Address has " + std::to_string(words.size()) +
                                    " words but --words " + std::to_string(*expected) + " was given",
                                __func__);
    }
}

int report_error(const NotwordsException& e, std::ostream& err) {
    err << "Error: " << e.what() << "\n";
    return EXIT_CODEC_ERROR;
}

int run_encode(const Codec& codec, const CodecOptions& opts, int default_words,
               std::ostream& out, std::ostream& err) {
    if (opts.positional.empty()) {
        err << "encode: missing coordinate\n";
        err << "Usage: notwords encode [-k KEY] [-w 3|4|6] <coordinate>\n";
        return EXIT_USAGE;
    }

    try {
        const WordCount count = word_count_from_int(opts.words.value_or(default_words));
        LOG_DEBUG("encode: ", word_count_value(count), " words, ", opts.key.empty() ? "unkeyed" : "keyed");

        out << "Encoded address: " << codec.encode_text(join_tokens(opts.positional), opts.key, count) << "\n";
        return EXIT_OK;
    } catch (const NotwordsException& e) {
        return report_error(e, err);
    }
}

int run_decode(const Codec& codec, const CodecOptions& opts,
               std::ostream& out, std::ostream& err) {
    if (opts.positional.size() != 1) {
        err << "decode: expected exactly one word address\n";
        err << "Usage: notwords decode [-k KEY] [-w 3|4|6] <word-word-word>\n";
        return EXIT_USAGE;
    }

    try {
        const WordSequence words = split_words(opts.positional[0]);
        check_word_count(words, opts.words);
        LOG_DEBUG("decode: ", words.size(), " words, ", opts.key.empty() ? "unkeyed" : "keyed");

        out << "Decoded coordinates: " << format_coordinate(codec.decode(words, opts.key)) << "\n";
        return EXIT_OK;
    } catch (const NotwordsException& e) {
        return report_error(e, err);
    }
}

} // namespace notwords::cli
