// =============================================================================
// Key Transform Tests
// =============================================================================

#include <gtest/gtest.h>
#include "notwords/key_transform.hpp"
#include "notwords/error.hpp"
#include <random>
#include <string>

using namespace notwords;

class KeyTransformTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(KeyTransformTest, KnownKeystreams) {
    EXPECT_EQ(KeyTransform::keystream("secret"), 0x4443567ac10abaa2ULL);
    EXPECT_EQ(KeyTransform::keystream("a"), 0x74e407ae4d6c35d2ULL);
}

// Keys are raw bytes: no case folding or trimming
TEST_F(KeyTransformTest, KeysAreExactBytes) {
    EXPECT_EQ(KeyTransform::keystream("Secret"), 0xaabeda6897ab2c05ULL);
    EXPECT_EQ(KeyTransform::keystream("secret "), 0x1b30b7c97be85040ULL);
}

TEST_F(KeyTransformTest, EmptyKeyIsIdentity) {
    KeyTransform identity;
    EXPECT_TRUE(identity.is_identity());
    EXPECT_TRUE(KeyTransform("").is_identity());
    EXPECT_EQ(KeyTransform::keystream(""), 0u);
    EXPECT_EQ(KeyTransform::apply(25408928425388ULL, "", 45), 25408928425388ULL);
}

TEST_F(KeyTransformTest, MasksToPrecision) {
    const uint32_t bits = 45;
    const uint64_t mask = (uint64_t{1} << bits) - 1;
    EXPECT_EQ(KeyTransform::apply(0, "secret", bits), 0x4443567ac10abaa2ULL & mask);
}

TEST_F(KeyTransformTest, SelfInverse) {
    std::mt19937_64 rng(7);
    for (uint32_t bits : {45u, 48u}) {
        const uint64_t mask = (uint64_t{1} << bits) - 1;
        for (int i = 0; i < 500; ++i) {
            const uint64_t cell = rng() & mask;
            const std::string key = "key-" + std::to_string(i);
            KeyTransform transform(key);

            const CellIndex visible = transform.apply(cell, bits);
            EXPECT_EQ(visible >> bits, 0u);
            EXPECT_EQ(transform.invert(visible, bits), cell);
            EXPECT_EQ(KeyTransform::invert(visible, key, bits), cell);
        }
    }
}

TEST_F(KeyTransformTest, DistinctKeysDistinctImages) {
    const CellIndex cell = 25408928425388ULL;
    int collisions = 0;
    for (int i = 0; i < 200; ++i) {
        const std::string a = "alpha" + std::to_string(i);
        const std::string b = "bravo" + std::to_string(i);
        if (KeyTransform::apply(cell, a, 45) == KeyTransform::apply(cell, b, 45)) {
            ++collisions;
        }
    }
    EXPECT_EQ(collisions, 0);
}

TEST_F(KeyTransformTest, RejectsWideCell) {
    EXPECT_THROW(KeyTransform("secret").apply(CellIndex{1} << 45, 45), NotwordsException);
}

TEST_F(KeyTransformTest, RejectsBadPrecision) {
    EXPECT_THROW(KeyTransform("secret").apply(0, 0), NotwordsException);
    EXPECT_THROW(KeyTransform("secret").apply(0, 65), NotwordsException);
    EXPECT_NO_THROW(KeyTransform("secret").apply(~uint64_t{0}, 64));
}
