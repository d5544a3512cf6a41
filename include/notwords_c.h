/**
 * notwords_c.h - C API for the notwords codec
 *
 * Pure C interface over the C++ codec for embedding in C programs and
 * foreign-function bindings. Every function reports failure through an
 * nw_status_t; the message of the last failure on the calling thread is
 * available from nw_last_error_message().
 *
 * Keys are passed on every call and never retained. NULL or "" selects the
 * unkeyed codec.
 */

#ifndef NOTWORDS_C_H
#define NOTWORDS_C_H

#include <stddef.h>
#include <stdint.h>

/* DLL export/import macros for Windows */
#ifdef _WIN32
    #ifdef NOTWORDS_C_EXPORTS
        #define NW_API __declspec(dllexport)
    #else
        #define NW_API __declspec(dllimport)
    #endif
#else
    #define NW_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Type Definitions
 * ============================================================================ */

typedef enum {
    NW_OK = 0,
    NW_ERR_INVALID_ARGUMENT,
    NW_ERR_OUT_OF_RANGE,
    NW_ERR_MALFORMED_COORDINATE,
    NW_ERR_UNSUPPORTED_WORD_COUNT,
    NW_ERR_WRONG_WORD_COUNT,
    NW_ERR_UNKNOWN_WORD,
    NW_ERR_INDEX_OUT_OF_RANGE,
    NW_ERR_INVALID_WORDLIST,
    NW_ERR_FILE_NOT_FOUND,
    NW_ERR_BUFFER_TOO_SMALL,
    NW_ERR_INTERNAL
} nw_status_t;

/** Opaque codec handle (immutable, shareable between threads) */
typedef struct nw_codec nw_codec_t;

/* ============================================================================
 * Codec Lifecycle
 * ============================================================================ */

/** Codec over the built-in vocabulary. Returns NULL on failure. */
NW_API nw_codec_t* nw_codec_create(void);

/**
 * Codec over word files (one word per line). A NULL path selects the
 * built-in list for that word count. Returns NULL on failure.
 */
NW_API nw_codec_t* nw_codec_create_from_files(const char* three_words_path,
                                              const char* four_words_path,
                                              const char* six_words_path);

NW_API void nw_codec_destroy(nw_codec_t* codec);

/* ============================================================================
 * Encoding / Decoding
 * ============================================================================ */

/**
 * Encode a coordinate as a hyphen-joined address into out (NUL-terminated).
 * word_count must be 3, 4 or 6.
 */
NW_API nw_status_t nw_encode(const nw_codec_t* codec,
                             double latitude, double longitude,
                             const char* key, int word_count,
                             char* out, size_t out_size);

/** Decode a '-' or '.' separated address to the center of its cell. */
NW_API nw_status_t nw_decode(const nw_codec_t* codec,
                             const char* address, const char* key,
                             double* latitude, double* longitude);

/** Parse coordinate text ("lat lon", "lat,lon", "lat, lon") and encode it. */
NW_API nw_status_t nw_encode_text(const nw_codec_t* codec,
                                  const char* coordinate_text,
                                  const char* key, int word_count,
                                  char* out, size_t out_size);

/* ============================================================================
 * Diagnostics
 * ============================================================================ */

/** Stable name of a status ("OutOfRange", "UnknownWord", ...) */
NW_API const char* nw_status_name(nw_status_t status);

/** Message of the last failure on this thread ("" if none) */
NW_API const char* nw_last_error_message(void);

#ifdef __cplusplus
}
#endif

#endif /* NOTWORDS_C_H */
