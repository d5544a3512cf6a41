// =============================================================================
// Blake3 Hash Tests
// =============================================================================

#include <gtest/gtest.h>
#include "notwords/blake3.hpp"
#include <string>
#include <vector>

using namespace notwords;

class Blake3Test : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    // Official test-vector input: byte i is i % 251
    static std::vector<uint8_t> vector_input(size_t length) {
        std::vector<uint8_t> data(length);
        for (size_t i = 0; i < length; ++i) {
            data[i] = static_cast<uint8_t>(i % 251);
        }
        return data;
    }
};

static constexpr const char* VECTOR_CONTEXT = "BLAKE3 2019-12-27 16:29:52 test vectors context";

// =============================================================================
// Known vectors
// =============================================================================

TEST_F(Blake3Test, EmptyInput) {
    auto hash = Blake3Hasher::hash(std::string_view{});
    EXPECT_EQ(hash.to_hex(), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST_F(Blake3Test, SingleZeroByte) {
    auto data = vector_input(1);
    auto hash = Blake3Hasher::hash(std::span<const uint8_t>(data));
    EXPECT_EQ(hash.to_hex(), "2d3adedff11b61f14c886e35afa036736dcd87a74d27b5c1510225d0f592e213");
}

TEST_F(Blake3Test, Abc) {
    EXPECT_EQ(Blake3Hasher::hash(std::string_view("abc")).to_hex(),
              "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

// Crosses one chunk boundary
TEST_F(Blake3Test, TwoChunks) {
    auto data = vector_input(1025);
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(data)).to_hex(),
              "d00278ae47eb27b34faecf67b4fe263f82d5412916c1ffd97c8cb7fb814b8444");
}

TEST_F(Blake3Test, ExactlyTwoFullChunks) {
    auto data = vector_input(2048);
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(data)).to_hex(),
              "e776b6028c7cd22a4d0ba182a8bf62205d2ef576467e838ed6f2529b85fba24a");
}

// Unbalanced tree: three full chunks plus one byte
TEST_F(Blake3Test, UnbalancedTree) {
    auto data = vector_input(3073);
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(data)).to_hex(),
              "7124b49501012f81cc7f11ca069ec9226cecb8a2c850cfe644e327d22d3e1cd3");
}

TEST_F(Blake3Test, DeeperTree) {
    auto data = vector_input(8193);
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(data)).to_hex(),
              "bab6c09cb8ce8cf459261398d2e7aef35700bf488116ceb94a36d0f5f1b7bc3b");
}

// =============================================================================
// Key derivation
// =============================================================================

TEST_F(Blake3Test, DeriveKeyEmptyMaterial) {
    auto hash = Blake3Hasher::derive_key(VECTOR_CONTEXT, std::string_view{});
    EXPECT_EQ(hash.to_hex(), "2cc39783c223154fea8dfb7c1b1660f2ac2dcbd1c1de8277b0b0dd39b7e50d7d");
}

// Multi-chunk key material: parent nodes must carry the derive-key flag
TEST_F(Blake3Test, DeriveKeyMultiChunk) {
    auto data = vector_input(1025);
    auto hash = Blake3Hasher::derive_key(VECTOR_CONTEXT, std::span<const uint8_t>(data));
    EXPECT_EQ(hash.to_hex(), "effaa245f065fbf82ac186839a249707c3bddf6d3fdda22d1b95a3c970379bcb");
}

TEST_F(Blake3Test, DeriveKeyDiffersFromHash) {
    EXPECT_NE(Blake3Hasher::derive_key(VECTOR_CONTEXT, std::string_view("secret")),
              Blake3Hasher::hash(std::string_view("secret")));
}

TEST_F(Blake3Test, ContextSeparatesDerivedKeys) {
    auto a = Blake3Hasher::derive_key("context one", std::string_view("secret"));
    auto b = Blake3Hasher::derive_key("context two", std::string_view("secret"));
    EXPECT_NE(a, b);
}

TEST_F(Blake3Test, SpanAndStringViewAgree) {
    const std::string text = "The quick brown fox";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(bytes)), Blake3Hasher::hash(text));
}

// =============================================================================
// Blake3Hash helpers
// =============================================================================

TEST_F(Blake3Test, LowU64IsLittleEndian) {
    Blake3Hash hash;
    hash.bytes[0] = 0x01;
    hash.bytes[1] = 0x02;
    hash.bytes[7] = 0x80;
    hash.bytes[8] = 0xFF;  // beyond the first word
    EXPECT_EQ(hash.low_u64(), 0x8000000000000201ULL);
}

TEST_F(Blake3Test, HexConversion) {
    Blake3Hash hash;
    hash.bytes[0] = 0xAB;
    hash.bytes[31] = 0x0F;
    std::string hex = hash.to_hex();
    EXPECT_EQ(hex.length(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(62, 2), "0f");
}
