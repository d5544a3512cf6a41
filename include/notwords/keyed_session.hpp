#pragma once

#include "notwords/codec.hpp"
#include <mutex>
#include <string>
#include <string_view>

namespace notwords {

/**
 * "Current key" convenience for callers that set a key once and reuse it.
 *
 * Boundary-layer helper only: the Codec never holds a key. The current key
 * is guarded by a mutex, so a session may be shared, but concurrent callers
 * that need different keys should use Codec directly.
 */
class KeyedSession {
public:
    // The codec must outlive the session
    explicit KeyedSession(const Codec& codec) : codec_(codec) {}

    KeyedSession(const KeyedSession&) = delete;
    KeyedSession& operator=(const KeyedSession&) = delete;

    void set_key(std::string_view key);
    void clear_key();
    bool has_key() const;

    WordSequence encode(const Coordinate& coord, WordCount count = WordCount::Three) const;
    Coordinate decode(const WordSequence& words) const;

    std::string encode_text(std::string_view coordinate_text, WordCount count = WordCount::Three) const;
    std::string decode_text(std::string_view words_text) const;

private:
    std::string current_key() const;

    const Codec& codec_;
    mutable std::mutex mutex_;
    std::string key_;
};

} // namespace notwords
