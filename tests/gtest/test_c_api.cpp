// =============================================================================
// C API Tests
// =============================================================================

#include <gtest/gtest.h>
#include "notwords_c.h"
#include <cstring>
#include <string>

class CApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = nw_codec_create();
        ASSERT_NE(codec_, nullptr);
    }

    void TearDown() override {
        nw_codec_destroy(codec_);
    }

    nw_codec_t* codec_ = nullptr;
    char buffer_[128] = {};
};

TEST_F(CApiTest, EncodeDecode) {
    ASSERT_EQ(nw_encode(codec_, -33.867480754852295, 151.20700120925903, "secret", 3,
                        buffer_, sizeof(buffer_)), NW_OK);
    EXPECT_STREQ(buffer_, "desihu-tufori-limuvu");

    double lat = 0.0;
    double lon = 0.0;
    ASSERT_EQ(nw_decode(codec_, buffer_, "secret", &lat, &lon), NW_OK);
    EXPECT_DOUBLE_EQ(lat, -33.867480754852295);
    EXPECT_DOUBLE_EQ(lon, 151.20700120925903);
    EXPECT_STREQ(nw_last_error_message(), "");
}

TEST_F(CApiTest, NullKeyIsUnkeyed) {
    ASSERT_EQ(nw_encode(codec_, -33.867480754852295, 151.20700120925903, nullptr, 6,
                        buffer_, sizeof(buffer_)), NW_OK);
    EXPECT_STREQ(buffer_, "red-three-speaker-echo-crazy-iowa");
}

TEST_F(CApiTest, EncodeText) {
    ASSERT_EQ(nw_encode_text(codec_, "51.5007, -0.1246", "", 6, buffer_, sizeof(buffer_)), NW_OK);
    EXPECT_STREQ(buffer_, "lion-venus-pasta-summer-kitten-beer");

    EXPECT_EQ(nw_encode_text(codec_, "51.5007", "", 6, buffer_, sizeof(buffer_)),
              NW_ERR_MALFORMED_COORDINATE);
}

TEST_F(CApiTest, BufferTooSmall) {
    char small[8] = {};
    EXPECT_EQ(nw_encode(codec_, 0.0, 0.0, "", 3, small, sizeof(small)), NW_ERR_BUFFER_TOO_SMALL);
    EXPECT_NE(std::strlen(nw_last_error_message()), 0u);
    EXPECT_EQ(nw_encode(codec_, 0.0, 0.0, "", 3, nullptr, 0), NW_ERR_INVALID_ARGUMENT);
}

TEST_F(CApiTest, ErrorStatuses) {
    EXPECT_EQ(nw_encode(codec_, 91.0, 0.0, "", 3, buffer_, sizeof(buffer_)), NW_ERR_OUT_OF_RANGE);
    EXPECT_EQ(nw_encode(codec_, 0.0, 0.0, "", 5, buffer_, sizeof(buffer_)), NW_ERR_UNSUPPORTED_WORD_COUNT);

    double lat = 0.0;
    double lon = 0.0;
    EXPECT_EQ(nw_decode(codec_, "red-three", "", &lat, &lon), NW_ERR_WRONG_WORD_COUNT);
    EXPECT_EQ(nw_decode(codec_, "red-three-nonsense", "", &lat, &lon), NW_ERR_UNKNOWN_WORD);
    EXPECT_EQ(std::string(nw_last_error_message()).rfind("UnknownWord: ", 0), 0u);
    EXPECT_EQ(nw_decode(codec_, nullptr, "", &lat, &lon), NW_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(nw_decode(nullptr, "a-b-c", "", &lat, &lon), NW_ERR_INVALID_ARGUMENT);
}

TEST_F(CApiTest, MissingWordFile) {
    EXPECT_EQ(nw_codec_create_from_files(nullptr, "/nonexistent/notwords/four.txt", nullptr), nullptr);
    EXPECT_EQ(std::string(nw_last_error_message()).rfind("FileNotFound: ", 0), 0u);
}

TEST_F(CApiTest, StatusNames) {
    EXPECT_STREQ(nw_status_name(NW_OK), "Success");
    EXPECT_STREQ(nw_status_name(NW_ERR_OUT_OF_RANGE), "OutOfRange");
    EXPECT_STREQ(nw_status_name(NW_ERR_WRONG_WORD_COUNT), "WrongWordCount");
    EXPECT_STREQ(nw_status_name(NW_ERR_BUFFER_TOO_SMALL), "BufferTooSmall");
}
