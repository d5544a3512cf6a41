#pragma once

#include <stdexcept>
#include <string>

namespace notwords {

/**
 * Structured error reporting for the codec and its boundary layers.
 * Every failure surfaces to the immediate caller as a NotwordsException
 * carrying one of the codes below; nothing is retried.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Coordinate errors
    OUT_OF_RANGE = 100,
    MALFORMED_COORDINATE_TEXT = 101,

    // Word sequence errors
    UNSUPPORTED_WORD_COUNT = 200,
    WRONG_WORD_COUNT = 201,
    UNKNOWN_WORD = 202,

    // Configuration errors
    INDEX_OUT_OF_RANGE = 300,
    INVALID_WORDLIST = 301,
    FILE_NOT_FOUND = 302
};

// Stable kind name, as printed by the command-line tool
inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:                   return "Success";
        case ErrorCode::INVALID_ARGUMENT:          return "InvalidArgument";
        case ErrorCode::OUT_OF_RANGE:              return "OutOfRange";
        case ErrorCode::MALFORMED_COORDINATE_TEXT: return "MalformedCoordinateText";
        case ErrorCode::UNSUPPORTED_WORD_COUNT:    return "UnsupportedWordCount";
        case ErrorCode::WRONG_WORD_COUNT:          return "WrongWordCount";
        case ErrorCode::UNKNOWN_WORD:              return "UnknownWord";
        case ErrorCode::INDEX_OUT_OF_RANGE:        return "IndexOutOfRange";
        case ErrorCode::INVALID_WORDLIST:          return "InvalidWordlist";
        case ErrorCode::FILE_NOT_FOUND:            return "FileNotFound";
    }
    return "Unknown";
}

class NotwordsException : public std::runtime_error {
public:
    explicit NotwordsException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const char* kind() const noexcept { return error_code_name(code_); }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class OutOfRangeError : public NotwordsException {
public:
    explicit OutOfRangeError(const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : NotwordsException(ErrorCode::OUT_OF_RANGE, message, context, suggestion) {}
};

class MalformedCoordinateError : public NotwordsException {
public:
    explicit MalformedCoordinateError(const std::string& message,
                                      const std::string& context = "",
                                      const std::string& suggestion = "")
        : NotwordsException(ErrorCode::MALFORMED_COORDINATE_TEXT, message, context, suggestion) {}
};

class UnknownWordError : public NotwordsException {
public:
    explicit UnknownWordError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : NotwordsException(ErrorCode::UNKNOWN_WORD, message, context, suggestion) {}
};

class IOError : public NotwordsException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : NotwordsException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw NotwordsException(code, message, context, suggestion);
        }
    }
};

// Macros for common error checking
#define NOTWORDS_CHECK(condition, code, message) \
    notwords::ErrorHandler::check_condition(condition, code, message, __func__)

#define NOTWORDS_CHECK_ARGUMENT(condition, message) \
    NOTWORDS_CHECK(condition, notwords::ErrorCode::INVALID_ARGUMENT, message)

#define NOTWORDS_THROW(code, message) \
    throw notwords::NotwordsException(code, message, __func__)

} // namespace notwords
