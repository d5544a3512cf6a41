// =============================================================================
// Configuration and Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "notwords/config.hpp"
#include "notwords/logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace notwords;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("notwords_config_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        Config::getInstance().clear();
        set_log_output(std::cerr);
        set_log_level(LogLevel::WARN);
    }

    void write_file(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path path_;
};

// =============================================================================
// Values
// =============================================================================

TEST_F(ConfigTest, TypedGet) {
    Config& config = Config::getInstance();
    config.set("codec.default_words", "6");
    config.set("flag", "Yes");
    config.set("ratio", "0.25");

    EXPECT_EQ(config.get<int>("codec.default_words"), 6);
    EXPECT_TRUE(config.get<bool>("flag"));
    EXPECT_DOUBLE_EQ(config.get<double>("ratio"), 0.25);
    EXPECT_EQ(config.get<std::string>("missing", "fallback"), "fallback");
}

TEST_F(ConfigTest, UnparsableFallsBackToDefault) {
    Config& config = Config::getInstance();
    config.set("codec.default_words", "three");
    EXPECT_EQ(config.get<int>("codec.default_words", 3), 3);
}

TEST_F(ConfigTest, EmptyValueIsUnset) {
    Config& config = Config::getInstance();
    config.set("words.six", "");
    EXPECT_FALSE(config.has("words.six"));
    EXPECT_EQ(config.get<std::string>("words.six", "builtin"), "builtin");
}

// =============================================================================
// Loading
// =============================================================================

TEST_F(ConfigTest, LoadDefaults) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    if (!std::getenv("NW_DEFAULT_WORDS")) {
        EXPECT_EQ(config.get<int>("codec.default_words"), 3);
    }
    if (!std::getenv("NW_LOG_LEVEL")) {
        EXPECT_EQ(config.get<std::string>("log.level"), "warn");
    }
}

TEST_F(ConfigTest, LoadFile) {
    write_file("# word files\n"
               "words.six = /tmp/six.txt\n"
               "; another comment\n"
               "\n"
               "codec.default_words=4\n"
               "not a setting\n"
               "  log.level  =  debug  \n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(path_.string()));
    EXPECT_EQ(config.get<std::string>("words.six"), "/tmp/six.txt");
    EXPECT_EQ(config.get<int>("codec.default_words"), 4);
    EXPECT_EQ(config.get<std::string>("log.level"), "debug");
}

TEST_F(ConfigTest, MissingFileIsNotFatal) {
    EXPECT_TRUE(Config::getInstance().load(path_.string() + ".missing"));
}

TEST_F(ConfigTest, InvalidDefaultWordsFailsValidation) {
    write_file("codec.default_words = 5\n");
    EXPECT_FALSE(Config::getInstance().load(path_.string()));
}

TEST_F(ConfigTest, UnknownLogLevelResetToWarn) {
    write_file("log.level = chatty\n");
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(path_.string()));
    EXPECT_EQ(config.get<std::string>("log.level"), "warn");
}

// =============================================================================
// Logging
// =============================================================================

TEST_F(ConfigTest, ParseLogLevel) {
    LogLevel level = LogLevel::WARN;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_FALSE(parse_log_level("DEBUG", level));
}

TEST_F(ConfigTest, LoggerFiltersByLevel) {
    std::ostringstream out;
    set_log_output(out);
    set_log_level(LogLevel::WARN);

    LOG_INFO("hidden message");
    LOG_WARN("shown message ", 42);

    const std::string text = out.str();
    EXPECT_EQ(text.find("hidden message"), std::string::npos);
    EXPECT_NE(text.find("shown message 42"), std::string::npos);
}

TEST_F(ConfigTest, LevelThreshold) {
    set_log_level(LogLevel::ERROR);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
    EXPECT_FALSE(Logger::getInstance().enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::getInstance().enabled(LogLevel::ERROR));
}

TEST_F(ConfigTest, LineFormat) {
    std::ostringstream out;
    set_log_output(out);
    set_log_level(LogLevel::DEBUG);

    LOG_DEBUG("value=", 7);

    const std::string text = out.str();
    EXPECT_EQ(text.front(), '[');
    EXPECT_NE(text.find("] DEBG test_config.cpp:"), std::string::npos);
    EXPECT_NE(text.find("() - value=7\n"), std::string::npos);
}

TEST_F(ConfigTest, InitConfigAppliesLogLevel) {
    write_file("log.level = error\n");
    ASSERT_TRUE(init_config(path_.string()));
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
}
