#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "conclave/log.hpp"

using namespace conclave;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level = log::level();
        log::set_callback([this](LogLevel level, std::string_view component, std::string_view message) {
            lines.push_back(std::string(log_level_to_string(level)) + " " +
                            std::string(component) + ": " + std::string(message));
        });
    }

    void TearDown() override {
        log::set_callback(nullptr);
        log::set_level(previous_level);
    }

    LogLevel previous_level = LogLevel::Warn;
    std::vector<std::string> lines;
};

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
    log::set_level(LogLevel::Warn);
    log::debug("fetch", "hidden");
    log::info("fetch", "hidden");
    log::warn("fetch", "model-a failed");
    log::error("pipeline", "run failed");

    EXPECT_EQ(lines, (std::vector<std::string>{"warn fetch: model-a failed", "error pipeline: run failed"}));
}

TEST_F(LogTest, DebugLevelPassesEverything) {
    log::set_level(LogLevel::Debug);
    log::debug("openrouter", "request");
    log::info("critic", "2 discrepancies found");

    EXPECT_EQ(lines.size(), 2u);
    EXPECT_EQ(log::level(), LogLevel::Debug);
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LogLevel::Debug), "debug");
    EXPECT_STREQ(log_level_to_string(LogLevel::Info), "info");
    EXPECT_STREQ(log_level_to_string(LogLevel::Warn), "warn");
    EXPECT_STREQ(log_level_to_string(LogLevel::Error), "error");
}

TEST_F(LogTest, SinkMayLogFromInsideCallback) {
    log::set_level(LogLevel::Debug);
    log::set_callback([this](LogLevel level, std::string_view component, std::string_view message) {
        lines.push_back(std::string(component) + ": " + std::string(message));
        if (level == LogLevel::Warn) {
            log::debug("sink", "forwarded");
        }
    });

    log::warn("critic", "invalid output");

    EXPECT_EQ(lines, (std::vector<std::string>{"critic: invalid output", "sink: forwarded"}));
}
