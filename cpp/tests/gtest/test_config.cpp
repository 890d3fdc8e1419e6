// =============================================================================
// Config, Logging and Error Tests
// =============================================================================

#include <gtest/gtest.h>
#include "remap/config.hpp"
#include "remap/error.hpp"
#include "remap/logging.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace remap;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "remap_config_test.conf";
        std::ofstream out(path_);
        out << "# walk settings\n"
            << "walk.to = humidity\n"
            << "walk.mode=ranges\n"
            << "; ignored\n"
            << "custom.flag = yes\n";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        Config::getInstance().set("walk.to", "location");
        Config::getInstance().set("walk.mode", "values");
    }

    std::filesystem::path path_;
};

TEST_F(ConfigTest, FileValuesOverrideDefaults) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(path_.string()));

    EXPECT_EQ(config.get<std::string>("walk.to"), "humidity");
    EXPECT_EQ(config.get<std::string>("walk.mode"), "ranges");
    EXPECT_TRUE(config.get<bool>("custom.flag"));
    EXPECT_EQ(config.get<std::string>("missing.key", "fallback"), "fallback");
}

TEST_F(ConfigTest, InvalidModeFailsValidation) {
    Config& config = Config::getInstance();
    {
        std::ofstream out(path_, std::ios::app);
        out << "walk.mode = sideways\n";
    }
    EXPECT_FALSE(config.load(path_.string()));
}

TEST_F(ConfigTest, NonNumericIntFallsBackToDefault) {
    Config& config = Config::getInstance();
    config.set("some.count", "many");
    EXPECT_EQ(config.get<int>("some.count", 3), 3);
}

TEST(LoggingTest, LevelFiltering) {
    std::ostringstream sink;
    set_log_output(sink);
    set_log_level(LogLevel::WARN);

    LOG_INFO("hidden");
    LOG_WARN("shown ", 42);

    std::string text = sink.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("shown 42"), std::string::npos);
    EXPECT_NE(text.find("test_config.cpp"), std::string::npos);

    set_log_output(std::cerr);
}

TEST(LoggingTest, ParseLogLevel) {
    LogLevel level = LogLevel::WARN;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("off", level));
    EXPECT_EQ(level, LogLevel::OFF);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST(ErrorTest, MessageCarriesCodeAndContext) {
    ParseError error("Rule line needs three numbers", 12, "Expected three numbers");
    EXPECT_EQ(error.code(), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(error.line(), 12u);

    std::string what = error.what();
    EXPECT_NE(what.find("[100]"), std::string::npos);
    EXPECT_NE(what.find("line 12"), std::string::npos);
    EXPECT_NE(what.find("Suggestion: Expected three numbers"), std::string::npos);
}

TEST(ErrorTest, CheckArgumentMacro) {
    EXPECT_NO_THROW(REMAP_CHECK_ARGUMENT(true, "fine"));
    EXPECT_THROW(REMAP_CHECK_ARGUMENT(false, "broken"), InvalidArgumentError);
}
