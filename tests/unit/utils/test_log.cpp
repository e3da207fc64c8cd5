/**
 * @file test_log.cpp
 * @brief Leveled logger tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>

#include "atomcrypte/utils/log.h"

using namespace atomcrypte;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = log::level();
        saved_buf_ = std::cerr.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::cerr.rdbuf(saved_buf_);
        log::set_level(saved_level_);
    }

    std::string output() const { return captured_.str(); }

    std::ostringstream captured_;
    std::streambuf* saved_buf_ = nullptr;
    log::Level saved_level_ = log::Level::Warn;
};

TEST_F(LogTest, ParseLevelNames) {
    log::Level level = log::Level::Off;
    EXPECT_TRUE(log::parse_level("debug", level));
    EXPECT_EQ(level, log::Level::Debug);
    EXPECT_TRUE(log::parse_level("WARN", level));
    EXPECT_EQ(level, log::Level::Warn);
    EXPECT_TRUE(log::parse_level("off", level));
    EXPECT_EQ(level, log::Level::Off);
    EXPECT_FALSE(log::parse_level("verbose", level));
    EXPECT_EQ(level, log::Level::Off);
}

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
    log::set_level(log::Level::Warn);
    log::info("hidden message");
    log::warn("visible message");
    EXPECT_EQ(output().find("hidden message"), std::string::npos);
    EXPECT_NE(output().find("[WARN]"), std::string::npos);
    EXPECT_NE(output().find("visible message"), std::string::npos);
}

TEST_F(LogTest, OffSilencesEverything) {
    log::set_level(log::Level::Off);
    log::error("an error");
    log::benchmark("transform", 1.5);
    EXPECT_TRUE(output().empty());
}

TEST_F(LogTest, BenchmarkIgnoresLevelThreshold) {
    log::set_level(log::Level::Error);
    log::benchmark("key-derivation", 12.25);
    EXPECT_NE(output().find("[BENCH]"), std::string::npos);
    EXPECT_NE(output().find("key-derivation"), std::string::npos);
    EXPECT_NE(output().find("12.250 ms"), std::string::npos);
}
