#include "notwords/keyed_session.hpp"

namespace notwords {

void KeyedSession::set_key(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    key_.assign(key.data(), key.size());
}

void KeyedSession::clear_key() {
    std::lock_guard<std::mutex> lock(mutex_);
    key_.clear();
}

bool KeyedSession::has_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !key_.empty();
}

std::string KeyedSession::current_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_;
}

// Each call snapshots the key, so a concurrent set_key never splits an encode

WordSequence KeyedSession::encode(const Coordinate& coord, WordCount count) const {
    return codec_.encode(coord, current_key(), count);
}

Coordinate KeyedSession::decode(const WordSequence& words) const {
    return codec_.decode(words, current_key());
}

std::string KeyedSession::encode_text(std::string_view coordinate_text, WordCount count) const {
    return codec_.encode_text(coordinate_text, current_key(), count);
}

std::string KeyedSession::decode_text(std::string_view words_text) const {
    return codec_.decode_text(words_text, current_key());
}

} // namespace notwords
