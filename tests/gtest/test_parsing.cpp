// =============================================================================
// Coordinate and Address Text Tests
// =============================================================================

#include <gtest/gtest.h>
#include "notwords/parsing.hpp"
#include "notwords/error.hpp"
#include <string>

using namespace notwords;

class ParsingTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static ErrorCode code_of_parse(const std::string& text) {
        try {
            parse_coordinate(text);
        } catch (const NotwordsException& e) {
            return e.code();
        }
        return ErrorCode::SUCCESS;
    }
};

// =============================================================================
// parse_coordinate
// =============================================================================

TEST_F(ParsingTest, AcceptedShapes) {
    const Coordinate expected(51.5007, -0.1246);
    EXPECT_EQ(parse_coordinate("51.5007 -0.1246"), expected);
    EXPECT_EQ(parse_coordinate("51.5007,-0.1246"), expected);
    EXPECT_EQ(parse_coordinate("51.5007, -0.1246"), expected);
    EXPECT_EQ(parse_coordinate("  51.5007 ,  -0.1246  "), expected);
    EXPECT_EQ(parse_coordinate("51.5007\t-0.1246"), expected);
}

TEST_F(ParsingTest, IntegersAndExponents) {
    EXPECT_EQ(parse_coordinate("0 0"), Coordinate(0.0, 0.0));
    EXPECT_EQ(parse_coordinate("1e1, -2E1"), Coordinate(10.0, -20.0));
}

TEST_F(ParsingTest, SignsAndBareDecimalPoints) {
    EXPECT_EQ(parse_coordinate("+5 .5"), Coordinate(5.0, 0.5));
    EXPECT_EQ(parse_coordinate("5., -0.25e+1"), Coordinate(5.0, -2.5));
}

// Only signed decimal numbers are coordinates
TEST_F(ParsingTest, RejectsHexadecimal) {
    EXPECT_EQ(code_of_parse("0x10 5"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("10, 0X1p3"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("1e 5"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse(". 5"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("+-5 5"), ErrorCode::MALFORMED_COORDINATE_TEXT);
}

// Range is the quantizer's concern
TEST_F(ParsingTest, OutOfRangeStillParses) {
    EXPECT_EQ(parse_coordinate("91, 200"), Coordinate(91.0, 200.0));
}

TEST_F(ParsingTest, Malformed) {
    EXPECT_EQ(code_of_parse(""), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("51.5"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("1 2 3"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("1,2,3"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("north, west"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("51.5x -0.1"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("51.5,"), ErrorCode::MALFORMED_COORDINATE_TEXT);
}

TEST_F(ParsingTest, NonFinite) {
    EXPECT_EQ(code_of_parse("nan 0"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("0, inf"), ErrorCode::MALFORMED_COORDINATE_TEXT);
    EXPECT_EQ(code_of_parse("1e999 0"), ErrorCode::MALFORMED_COORDINATE_TEXT);
}

TEST_F(ParsingTest, FormatCoordinate) {
    EXPECT_EQ(format_coordinate(Coordinate(51.5007, -0.1246)), "51.5007, -0.1246");
    EXPECT_EQ(format_coordinate(Coordinate(-33.867480754852295, 151.20700120925903)),
              "-33.8674807549, 151.207001209");
}

// =============================================================================
// split_words / join_words
// =============================================================================

TEST_F(ParsingTest, SplitOnHyphenOrDot) {
    EXPECT_EQ(split_words("red-three-speaker"), (WordSequence{"red", "three", "speaker"}));
    EXPECT_EQ(split_words("red.three.speaker"), (WordSequence{"red", "three", "speaker"}));
}

TEST_F(ParsingTest, SplitNormalizes) {
    EXPECT_EQ(split_words("  Red - THREE -speaker "), (WordSequence{"red", "three", "speaker"}));
}

TEST_F(ParsingTest, SplitRejectsEmptyWords) {
    EXPECT_THROW(split_words(""), NotwordsException);
    EXPECT_THROW(split_words("   "), NotwordsException);
    EXPECT_THROW(split_words("red--speaker"), NotwordsException);
    EXPECT_THROW(split_words("red-three-"), NotwordsException);
}

TEST_F(ParsingTest, Join) {
    EXPECT_EQ(join_words({"red", "three", "speaker"}), "red-three-speaker");
    EXPECT_EQ(join_words({}), "");
}
