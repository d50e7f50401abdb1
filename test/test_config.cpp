/**
 * @file test_config.cpp
 * @brief Unit tests for BrkitConfig option handling
 */

#include <gtest/gtest.h>
#include "brkit_config.hpp"
#include "duckdb/common/exception.hpp"

#include <iostream>
#include <sstream>

using duckdb::InvalidInputException;
using duckdb::brkit::BrkitConfig;
using duckdb::brkit::log_info;
using duckdb::brkit::parse_bool_option;

class BrkitConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        BrkitConfig::GetInstance().Reset();
    }

    void TearDown() override {
        BrkitConfig::GetInstance().Reset();
    }
};

TEST_F(BrkitConfigTest, Defaults) {
    auto& config = BrkitConfig::GetInstance();
    EXPECT_FALSE(config.IsVerbose());
    EXPECT_FALSE(config.FormatUnvalidated());
    EXPECT_EQ(config.GetOption("verbose"), "false");
    EXPECT_EQ(config.GetOption("format_unvalidated"), "false");
}

TEST_F(BrkitConfigTest, SetOptionByName) {
    auto& config = BrkitConfig::GetInstance();

    config.SetOption("format_unvalidated", "true");
    EXPECT_TRUE(config.FormatUnvalidated());
    EXPECT_EQ(config.GetOption("format_unvalidated"), "true");

    config.SetOption("format_unvalidated", "off");
    EXPECT_FALSE(config.FormatUnvalidated());
}

TEST_F(BrkitConfigTest, NamesAreCaseInsensitiveAndTrimmed) {
    auto& config = BrkitConfig::GetInstance();
    config.SetOption("  VERBOSE ", "Yes");
    EXPECT_TRUE(config.IsVerbose());
    EXPECT_EQ(config.GetOption("Verbose"), "true");
}

TEST_F(BrkitConfigTest, UnknownOptionThrows) {
    auto& config = BrkitConfig::GetInstance();
    EXPECT_THROW(config.SetOption("no_such_option", "true"), InvalidInputException);
    EXPECT_THROW(config.GetOption("no_such_option"), InvalidInputException);
}

TEST_F(BrkitConfigTest, InvalidValueThrowsAndKeepsPreviousValue) {
    auto& config = BrkitConfig::GetInstance();
    config.SetOption("format_unvalidated", "1");
    EXPECT_THROW(config.SetOption("format_unvalidated", "maybe"), InvalidInputException);
    EXPECT_TRUE(config.FormatUnvalidated());
}

// ============================================================================
// Logging
// ============================================================================

class BrkitLoggingTest : public BrkitConfigTest {
protected:
    std::ostringstream captured_;
    std::streambuf* saved_ = nullptr;

    void SetUp() override {
        BrkitConfigTest::SetUp();
        saved_ = std::cout.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(saved_);
        BrkitConfigTest::TearDown();
    }
};

TEST_F(BrkitLoggingTest, QuietByDefault) {
    log_info("extension loaded");
    BrkitConfig::GetInstance().SetOption("format_unvalidated", "true");
    EXPECT_EQ(captured_.str(), "");
}

TEST_F(BrkitLoggingTest, VerboseWritesPrefixedLines) {
    auto& config = BrkitConfig::GetInstance();
    config.SetOption("verbose", "true");
    config.SetOption("format_unvalidated", "yes");
    log_info("extension loaded");

    EXPECT_EQ(captured_.str(),
              "brkit: option verbose set to true\n"
              "brkit: option format_unvalidated set to true\n"
              "brkit: extension loaded\n");
}

TEST_F(BrkitLoggingTest, DisablingVerboseStopsOutput) {
    auto& config = BrkitConfig::GetInstance();
    config.SetOption("verbose", "on");
    config.SetOption("verbose", "off");
    log_info("not shown");

    EXPECT_EQ(captured_.str(), "brkit: option verbose set to true\n");
}

TEST(ParseBoolOptionTest, AcceptedSpellings) {
    bool value = false;
    for (const char* s : {"true", "TRUE", "1", "on", "yes", " True "}) {
        value = false;
        EXPECT_TRUE(parse_bool_option(s, value)) << s;
        EXPECT_TRUE(value) << s;
    }
    for (const char* s : {"false", "0", "OFF", "no"}) {
        value = true;
        EXPECT_TRUE(parse_bool_option(s, value)) << s;
        EXPECT_FALSE(value) << s;
    }
    EXPECT_FALSE(parse_bool_option("", value));
    EXPECT_FALSE(parse_bool_option("2", value));
}
