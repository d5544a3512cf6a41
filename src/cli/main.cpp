// =============================================================================
// notwords CLI - Keyed coordinate <-> word address tool
// =============================================================================
//
// Usage:
//   notwords [global options] <command> [options]
//
// Commands:
//   encode      Encode a coordinate into a word address
//   decode      Decode a word address into the center of its cell
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   notwords encode -k secret --words 3 "-33.867480754852295,151.20700120925903"
//   notwords encode -33.867480754852295 151.20700120925903
//   notwords decode -k secret desihu-tufori-limuvu
//
// =============================================================================

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "notwords/cli_options.hpp"
#include "notwords/codec.hpp"
#include "notwords/config.hpp"
#include "notwords/logging.hpp"
#include "notwords/wordlist.hpp"

namespace notwords::cli {
    int cmd_encode(int argc, char* argv[]);
    int cmd_decode(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define NOTWORDS_VERSION_MAJOR 1
#define NOTWORDS_VERSION_MINOR 0
#define NOTWORDS_VERSION_PATCH 0
#define NOTWORDS_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"encode",  "Encode a coordinate into a word address", notwords::cli::cmd_encode},
    {"decode",  "Decode a word address into coordinates", notwords::cli::cmd_decode},
    {"version", "Show version information", notwords::cli::cmd_version},
    {"help",    "Show this help message", notwords::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
};

static GlobalOptions g_options;

// Built once per process from configuration
static const notwords::Codec& codec() {
    static const notwords::Codec instance(
        notwords::Vocabulary::from_config(notwords::Config::getInstance()));
    return instance;
}

namespace notwords::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "notwords - keyed word addresses for coordinates\n";
    std::cout << "Version " << NOTWORDS_VERSION_STRING << "\n\n";
    std::cout << "Usage: notwords [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nCommand Options:\n";
    std::cout << "  -k, --key <key>         Secret key (default: none, unkeyed)\n";
    std::cout << "  -w, --words <n>         Number of words: 3, 4 or 6 (default: 3)\n";
    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (key = value)\n";
    std::cout << "  -v, --verbose           Debug logging to stderr\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  NW_WORDS_THREE          Word file for three-word addresses\n";
    std::cout << "  NW_WORDS_FOUR           Word file for four-word addresses\n";
    std::cout << "  NW_WORDS_SIX            Word file for six-word addresses\n";
    std::cout << "  NW_DEFAULT_WORDS        Default word count\n";
    std::cout << "  NW_LOG_LEVEL            debug, info, warn, error\n";
    std::cout << "\nCoordinates: \"<lat> <lon>\", \"<lat>,<lon>\" or \"<lat>, <lon>\"\n";
    std::cout << "Addresses:   words separated by '-' or '.'\n";
    std::cout << "\nExamples:\n";
    std::cout << "  notwords encode -k secret \"-33.867480754852295,151.20700120925903\"\n";
    std::cout << "  notwords encode --words 6 51.5007 -0.1246\n";
    std::cout << "  notwords decode -k secret <word>-<word>-<word>\n";

    return EXIT_OK;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "notwords " << NOTWORDS_VERSION_STRING << "\n";
    for (WordCount count : SUPPORTED_WORD_COUNTS) {
        std::cout << "  " << word_count_value(count) << " words: "
                  << bit_precision(count) << "-bit grid, "
                  << required_radix(count) << "-word vocabulary\n";
    }
    return EXIT_OK;
}

// =============================================================================
// Encode Command
// =============================================================================

int cmd_encode(int argc, char* argv[]) {
    CodecOptions opts;
    if (!parse_codec_options(std::vector<std::string>(argv, argv + argc), opts, std::cerr)) {
        return EXIT_USAGE;
    }

    try {
        return run_encode(codec(), opts, Config::getInstance().get<int>("codec.default_words", 3),
                          std::cout, std::cerr);
    } catch (const NotwordsException& e) {
        // Word files are loaded on first use
        return report_error(e, std::cerr);
    }
}

// =============================================================================
// Decode Command
// =============================================================================

int cmd_decode(int argc, char* argv[]) {
    CodecOptions opts;
    if (!parse_codec_options(std::vector<std::string>(argv, argv + argc), opts, std::cerr)) {
        return EXIT_USAGE;
    }

    try {
        return run_decode(codec(), opts, std::cout, std::cerr);
    } catch (const NotwordsException& e) {
        return report_error(e, std::cerr);
    }
}

} // namespace notwords::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!notwords::init_config(g_options.config_file)) {
        return notwords::cli::EXIT_USAGE;
    }
    if (g_options.verbose) {
        notwords::set_log_level(notwords::LogLevel::DEBUG);
    }

    if (argc < 1) {
        notwords::cli::cmd_help(0, nullptr);
        return notwords::cli::EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'notwords help' for usage.\n";
    return notwords::cli::EXIT_USAGE;
}
