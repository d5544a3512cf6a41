/**
 * notwords_c.cpp - C API Implementation
 *
 * Wraps the C++ codec behind the extern "C" functions declared in notwords_c.h.
 * Exceptions never cross the boundary: each one becomes an nw_status_t and a
 * thread-local message.
 */

#include "notwords_c.h"
#include "notwords/codec.hpp"
#include "notwords/error.hpp"
#include "notwords/parsing.hpp"
#include "notwords/wordlist.hpp"

#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <string_view>

using namespace notwords;

struct nw_codec {
    std::unique_ptr<Codec> codec;
};

/* ============================================================================
 * Internal Conversion Helpers
 * ============================================================================ */

namespace {

thread_local std::string g_last_error;

nw_status_t to_c(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                   return NW_OK;
        case ErrorCode::INVALID_ARGUMENT:          return NW_ERR_INVALID_ARGUMENT;
        case ErrorCode::OUT_OF_RANGE:              return NW_ERR_OUT_OF_RANGE;
        case ErrorCode::MALFORMED_COORDINATE_TEXT: return NW_ERR_MALFORMED_COORDINATE;
        case ErrorCode::UNSUPPORTED_WORD_COUNT:    return NW_ERR_UNSUPPORTED_WORD_COUNT;
        case ErrorCode::WRONG_WORD_COUNT:          return NW_ERR_WRONG_WORD_COUNT;
        case ErrorCode::UNKNOWN_WORD:              return NW_ERR_UNKNOWN_WORD;
        case ErrorCode::INDEX_OUT_OF_RANGE:        return NW_ERR_INDEX_OUT_OF_RANGE;
        case ErrorCode::INVALID_WORDLIST:          return NW_ERR_INVALID_WORDLIST;
        case ErrorCode::FILE_NOT_FOUND:            return NW_ERR_FILE_NOT_FOUND;
    }
    return NW_ERR_INTERNAL;
}

nw_status_t fail(nw_status_t status, const std::string& message) {
    g_last_error = message;
    return status;
}

// Run fn, translating exceptions into a status and the thread-local message
template<typename Fn>
nw_status_t guarded(Fn&& fn) {
    try {
        g_last_error.clear();
        return fn();
    } catch (const NotwordsException& e) {
        return fail(to_c(e.code()), e.what());
    } catch (const std::bad_alloc&) {
        return fail(NW_ERR_INTERNAL, "Out of memory");
    } catch (const std::exception& e) {
        return fail(NW_ERR_INTERNAL, e.what());
    }
}

nw_status_t copy_out(const std::string& text, char* out, size_t out_size) {
    if (!out || out_size == 0) {
        return fail(NW_ERR_INVALID_ARGUMENT, "Output buffer is NULL or empty");
    }
    if (text.size() + 1 > out_size) {
        return fail(NW_ERR_BUFFER_TOO_SMALL,
                    "Output needs " + std::to_string(text.size() + 1) + " bytes");
    }
    std::memcpy(out, text.c_str(), text.size() + 1);
    return NW_OK;
}

inline std::string_view key_of(const char* key) {
    return key ? std::string_view(key) : std::string_view{};
}

} // anonymous namespace

extern "C" {

/* ============================================================================
 * Codec Lifecycle
 * ============================================================================ */

nw_codec_t* nw_codec_create(void) {
    return nw_codec_create_from_files(nullptr, nullptr, nullptr);
}

nw_codec_t* nw_codec_create_from_files(const char* three_words_path,
                                       const char* four_words_path,
                                       const char* six_words_path) {
    nw_codec_t* handle = nullptr;
    nw_status_t status = guarded([&]() {
        auto pick = [](const char* path, Wordlist fallback) {
            return path ? Wordlist::load(path) : fallback;
        };
        Vocabulary vocabulary(
            pick(three_words_path, Wordlist::syllabic(required_radix(WordCount::Three))),
            pick(four_words_path, Wordlist::syllabic(required_radix(WordCount::Four))),
            pick(six_words_path, Wordlist::human()));

        auto created = std::make_unique<nw_codec>();
        created->codec = std::make_unique<Codec>(std::move(vocabulary));
        handle = created.release();
        return NW_OK;
    });
    return status == NW_OK ? handle : nullptr;
}

void nw_codec_destroy(nw_codec_t* codec) {
    delete codec;
}

/* ============================================================================
 * Encoding / Decoding
 * ============================================================================ */

nw_status_t nw_encode(const nw_codec_t* codec,
                      double latitude, double longitude,
                      const char* key, int word_count,
                      char* out, size_t out_size) {
    if (!codec) return fail(NW_ERR_INVALID_ARGUMENT, "Codec handle is NULL");

    return guarded([&]() {
        WordCount count = word_count_from_int(word_count);
        WordSequence words = codec->codec->encode(Coordinate(latitude, longitude), key_of(key), count);
        return copy_out(join_words(words), out, out_size);
    });
}

nw_status_t nw_decode(const nw_codec_t* codec,
                      const char* address, const char* key,
                      double* latitude, double* longitude) {
    if (!codec) return fail(NW_ERR_INVALID_ARGUMENT, "Codec handle is NULL");
    if (!address || !latitude || !longitude) {
        return fail(NW_ERR_INVALID_ARGUMENT, "NULL address or output pointer");
    }

    return guarded([&]() {
        Coordinate coord = codec->codec->decode(split_words(address), key_of(key));
        *latitude = coord.latitude;
        *longitude = coord.longitude;
        return NW_OK;
    });
}

nw_status_t nw_encode_text(const nw_codec_t* codec,
                           const char* coordinate_text,
                           const char* key, int word_count,
                           char* out, size_t out_size) {
    if (!codec) return fail(NW_ERR_INVALID_ARGUMENT, "Codec handle is NULL");
    if (!coordinate_text) return fail(NW_ERR_INVALID_ARGUMENT, "Coordinate text is NULL");

    return guarded([&]() {
        WordCount count = word_count_from_int(word_count);
        return copy_out(codec->codec->encode_text(coordinate_text, key_of(key), count), out, out_size);
    });
}

/* ============================================================================
 * Diagnostics
 * ============================================================================ */

const char* nw_status_name(nw_status_t status) {
    switch (status) {
        case NW_OK:                         return "Success";
        case NW_ERR_INVALID_ARGUMENT:       return "InvalidArgument";
        case NW_ERR_OUT_OF_RANGE:           return "OutOfRange";
        case NW_ERR_MALFORMED_COORDINATE:   return "MalformedCoordinateText";
        case NW_ERR_UNSUPPORTED_WORD_COUNT: return "UnsupportedWordCount";
        case NW_ERR_WRONG_WORD_COUNT:       return "WrongWordCount";
        case NW_ERR_UNKNOWN_WORD:           return "UnknownWord";
        case NW_ERR_INDEX_OUT_OF_RANGE:     return "IndexOutOfRange";
        case NW_ERR_INVALID_WORDLIST:       return "InvalidWordlist";
        case NW_ERR_FILE_NOT_FOUND:         return "FileNotFound";
        case NW_ERR_BUFFER_TOO_SMALL:       return "BufferTooSmall";
        case NW_ERR_INTERNAL:               return "Internal";
    }
    return "Unknown";
}

const char* nw_last_error_message(void) {
    return g_last_error.c_str();
}

} // extern "C"
