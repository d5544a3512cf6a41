#include "notwords/blake3.hpp"

#include <cstring>

// Portable BLAKE3 (single-threaded, no SIMD). Inputs here are short keys,
// so the tree mode is only exercised for keys longer than one chunk.

namespace {

constexpr size_t BLOCK_LEN = 64;
constexpr size_t CHUNK_LEN = 1024;
constexpr size_t OUT_LEN = 32;
constexpr size_t MAX_DEPTH = 54;

constexpr uint32_t IV[8] = {
    0x6A09E667, 0xBB67AE85, 0x3C6EF372, 0xA54FF53A,
    0x510E527F, 0x9B05688C, 0x1F83D9AB, 0x5BE0CD19
};

constexpr uint8_t MSG_SCHEDULE[7][16] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
    {2, 6, 3, 10, 7, 0, 4, 13, 1, 11, 12, 5, 9, 14, 15, 8},
    {3, 4, 10, 12, 13, 2, 7, 14, 6, 5, 9, 0, 11, 15, 8, 1},
    {10, 7, 12, 9, 14, 3, 13, 15, 4, 0, 11, 2, 5, 8, 1, 6},
    {12, 13, 9, 11, 15, 10, 14, 8, 7, 2, 5, 3, 0, 1, 6, 4},
    {9, 14, 11, 5, 8, 12, 15, 1, 13, 3, 0, 10, 2, 6, 4, 7},
    {11, 15, 5, 0, 1, 9, 8, 6, 14, 10, 2, 12, 3, 4, 7, 13},
};

enum Flags : uint8_t {
    CHUNK_START = 1 << 0,
    CHUNK_END = 1 << 1,
    PARENT = 1 << 2,
    ROOT = 1 << 3,
    KEYED_HASH = 1 << 4,
    DERIVE_KEY_CONTEXT = 1 << 5,
    DERIVE_KEY_MATERIAL = 1 << 6,
};

inline uint32_t rotr32(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store32_le(uint8_t* p, uint32_t x) {
    p[0] = static_cast<uint8_t>(x);
    p[1] = static_cast<uint8_t>(x >> 8);
    p[2] = static_cast<uint8_t>(x >> 16);
    p[3] = static_cast<uint8_t>(x >> 24);
}

void g(uint32_t* state, size_t a, size_t b, size_t c, size_t d, uint32_t mx, uint32_t my) {
    state[a] = state[a] + state[b] + mx;
    state[d] = rotr32(state[d] ^ state[a], 16);
    state[c] = state[c] + state[d];
    state[b] = rotr32(state[b] ^ state[c], 12);
    state[a] = state[a] + state[b] + my;
    state[d] = rotr32(state[d] ^ state[a], 8);
    state[c] = state[c] + state[d];
    state[b] = rotr32(state[b] ^ state[c], 7);
}

void round_fn(uint32_t* state, const uint32_t* msg, size_t round) {
    const uint8_t* s = MSG_SCHEDULE[round];
    // Columns
    g(state, 0, 4, 8, 12, msg[s[0]], msg[s[1]]);
    g(state, 1, 5, 9, 13, msg[s[2]], msg[s[3]]);
    g(state, 2, 6, 10, 14, msg[s[4]], msg[s[5]]);
    g(state, 3, 7, 11, 15, msg[s[6]], msg[s[7]]);
    // Diagonals
    g(state, 0, 5, 10, 15, msg[s[8]], msg[s[9]]);
    g(state, 1, 6, 11, 12, msg[s[10]], msg[s[11]]);
    g(state, 2, 7, 8, 13, msg[s[12]], msg[s[13]]);
    g(state, 3, 4, 9, 14, msg[s[14]], msg[s[15]]);
}

// Compression function; writes the first 8 output words (the chaining value)
void compress(const uint32_t cv[8], const uint8_t block[BLOCK_LEN],
              uint8_t block_len, uint64_t counter, uint8_t flags,
              uint32_t out[8]) {
    uint32_t msg[16];
    for (size_t i = 0; i < 16; ++i) {
        msg[i] = load32_le(&block[i * 4]);
    }

    uint32_t state[16] = {
        cv[0], cv[1], cv[2], cv[3],
        cv[4], cv[5], cv[6], cv[7],
        IV[0], IV[1], IV[2], IV[3],
        static_cast<uint32_t>(counter),
        static_cast<uint32_t>(counter >> 32),
        block_len,
        flags
    };

    for (size_t r = 0; r < 7; ++r) {
        round_fn(state, msg, r);
    }

    for (size_t i = 0; i < 8; ++i) {
        out[i] = state[i] ^ state[i + 8];
    }
}

struct ChunkState {
    uint32_t cv[8];
    uint64_t chunk_counter;
    uint8_t buf[BLOCK_LEN];
    uint8_t buf_len;
    uint8_t blocks_compressed;
    uint8_t flags;

    void reset(const uint32_t key[8], uint64_t counter) {
        std::memcpy(cv, key, sizeof(cv));
        chunk_counter = counter;
        std::memset(buf, 0, BLOCK_LEN);
        buf_len = 0;
        blocks_compressed = 0;
    }

    size_t len() const {
        return BLOCK_LEN * static_cast<size_t>(blocks_compressed) + buf_len;
    }

    uint8_t start_flag() const {
        return blocks_compressed == 0 ? CHUNK_START : 0;
    }

    void update(const uint8_t* input, size_t input_len) {
        while (input_len > 0) {
            if (buf_len == BLOCK_LEN) {
                compress(cv, buf, BLOCK_LEN, chunk_counter,
                         static_cast<uint8_t>(flags | start_flag()), cv);
                blocks_compressed++;
                buf_len = 0;
                std::memset(buf, 0, BLOCK_LEN);
            }

            size_t take = BLOCK_LEN - buf_len;
            if (take > input_len) take = input_len;
            std::memcpy(&buf[buf_len], input, take);
            buf_len = static_cast<uint8_t>(buf_len + take);
            input += take;
            input_len -= take;
        }
    }

    void finalize(bool is_root, uint32_t out[8]) const {
        uint8_t f = static_cast<uint8_t>(flags | start_flag() | CHUNK_END);
        if (is_root) f |= ROOT;
        compress(cv, buf, buf_len, chunk_counter, f, out);
    }
};

void parent_cv(const uint32_t left[8], const uint32_t right[8],
               const uint32_t key[8], uint8_t flags, uint32_t out[8]) {
    uint8_t block[BLOCK_LEN];
    for (size_t i = 0; i < 8; ++i) {
        store32_le(&block[i * 4], left[i]);
        store32_le(&block[32 + i * 4], right[i]);
    }
    compress(key, block, BLOCK_LEN, 0, static_cast<uint8_t>(flags | PARENT), out);
}

class Hasher {
public:
    Hasher(const uint32_t key[8], uint8_t flags) {
        std::memcpy(key_, key, sizeof(key_));
        chunk_.flags = flags;
        chunk_.reset(key_, 0);
    }

    void update(const uint8_t* input, size_t input_len) {
        while (input_len > 0) {
            if (chunk_.len() == CHUNK_LEN) {
                uint32_t cv[8];
                chunk_.finalize(false, cv);
                uint64_t total_chunks = chunk_.chunk_counter + 1;
                add_chunk_cv(cv, total_chunks);
                chunk_.reset(key_, total_chunks);
            }

            size_t take = CHUNK_LEN - chunk_.len();
            if (take > input_len) take = input_len;
            chunk_.update(input, take);
            input += take;
            input_len -= take;
        }
    }

    void finalize(uint8_t out[OUT_LEN]) const {
        uint32_t cv[8];
        chunk_.finalize(stack_len_ == 0, cv);

        // Merge the remaining subtrees right to left; only the last merge is the root
        for (size_t i = stack_len_; i > 0; --i) {
            uint8_t f = chunk_.flags;
            if (i == 1) f |= ROOT;
            parent_cv(stack_[i - 1], cv, key_, f, cv);
        }

        for (size_t i = 0; i < 8; ++i) {
            store32_le(&out[i * 4], cv[i]);
        }
    }

private:
    void add_chunk_cv(uint32_t new_cv[8], uint64_t total_chunks) {
        while ((total_chunks & 1) == 0) {
            --stack_len_;
            parent_cv(stack_[stack_len_], new_cv, key_, chunk_.flags, new_cv);
            total_chunks >>= 1;
        }
        std::memcpy(stack_[stack_len_], new_cv, sizeof(stack_[0]));
        ++stack_len_;
    }

    uint32_t key_[8];
    ChunkState chunk_;
    uint32_t stack_[MAX_DEPTH][8];
    size_t stack_len_ = 0;
};

} // anonymous namespace

namespace notwords {

Blake3Hash Blake3Hasher::hash(std::span<const uint8_t> data) noexcept {
    Hasher hasher(IV, 0);
    hasher.update(data.data(), data.size());

    Blake3Hash result;
    hasher.finalize(result.bytes.data());
    return result;
}

Blake3Hash Blake3Hasher::hash(std::string_view str) noexcept {
    return hash(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

Blake3Hash Blake3Hasher::derive_key(std::string_view context,
                                    std::span<const uint8_t> key_material) noexcept {
    Hasher context_hasher(IV, DERIVE_KEY_CONTEXT);
    context_hasher.update(reinterpret_cast<const uint8_t*>(context.data()), context.size());

    uint8_t context_key_bytes[OUT_LEN];
    context_hasher.finalize(context_key_bytes);

    uint32_t context_key[8];
    for (size_t i = 0; i < 8; ++i) {
        context_key[i] = load32_le(&context_key_bytes[i * 4]);
    }

    Hasher material_hasher(context_key, DERIVE_KEY_MATERIAL);
    material_hasher.update(key_material.data(), key_material.size());

    Blake3Hash result;
    material_hasher.finalize(result.bytes.data());
    return result;
}

Blake3Hash Blake3Hasher::derive_key(std::string_view context,
                                    std::string_view key_material) noexcept {
    return derive_key(context, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(key_material.data()), key_material.size()));
}

} // namespace notwords
