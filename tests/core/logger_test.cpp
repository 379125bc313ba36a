#include <gtest/gtest.h>
#include <carlink/core/logger.hpp>

#include <string>
#include <utility>
#include <vector>

namespace carlink::core::test {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = Logger::getLevel();
        Logger::setLevel(LogLevel::DEBUG);
        Logger::setSink([this](LogLevel level, const std::string& message) {
            messages_.emplace_back(level, message);
        });
    }

    void TearDown() override {
        Logger::resetSink();
        Logger::setLevel(previous_level_);
    }

    LogLevel previous_level_ = LogLevel::INFO;
    std::vector<std::pair<LogLevel, std::string>> messages_;
};

TEST_F(LoggerTest, BasicLogging) {
    Logger::info("Test message");
    ASSERT_EQ(messages_.size(), 1);
    EXPECT_EQ(messages_[0].first, LogLevel::INFO);
    EXPECT_EQ(messages_[0].second, "Test message");
}

TEST_F(LoggerTest, LogLevels) {
    Logger::setLevel(LogLevel::WARN);

    Logger::debug("Debug message");
    Logger::info("Info message");
    Logger::warn("Warning message");
    Logger::error("Error message");

    ASSERT_EQ(messages_.size(), 2);
    EXPECT_EQ(messages_[0].second, "Warning message");
    EXPECT_EQ(messages_[1].second, "Error message");
}

TEST_F(LoggerTest, FormatString) {
    Logger::info("Value: {}, String: {}", 42, "test");
    ASSERT_EQ(messages_.size(), 1);
    EXPECT_EQ(messages_[0].second, "Value: 42, String: test");
}

// Placeholder di dalam nilai yang disisipkan tidak ikut diganti
TEST_F(LoggerTest, FormatDoesNotReplaceInsideValues) {
    auto text = Logger::format("{} then {}", "{}", 7);
    EXPECT_EQ(text, "{} then 7");
}

TEST_F(LoggerTest, FormatBoolAndExtraPlaceholders) {
    EXPECT_EQ(Logger::format("open={}", true), "open=true");
    EXPECT_EQ(Logger::format("a={} b={}", 1), "a=1 b={}");
    EXPECT_EQ(Logger::format("no placeholders", 1), "no placeholders");
}

TEST_F(LoggerTest, MultipleMessages) {
    for (int i = 0; i < 5; ++i) {
        Logger::info("Message {}", i);
    }

    ASSERT_EQ(messages_.size(), 5);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(messages_[i].second, "Message " + std::to_string(i));
    }
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("INFO"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("Error"), LogLevel::ERROR);
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
}

} // namespace carlink::core::test
