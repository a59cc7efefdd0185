#include <gtest/gtest.h>

#include "runtime/core/log/log_system.h"

#include <stdexcept>
#include <string>

namespace docket {
namespace test {

class LogSystemTest : public ::testing::Test {
protected:
    void TearDown() override {
        getLogSystem()->setLevel(LogLevel::Warn);
    }
};

TEST_F(LogSystemTest, LogSystemExists) {
    EXPECT_NE(getLogSystem(), nullptr);
}

TEST_F(LogSystemTest, CanLogAtEveryNonFatalLevel) {
    EXPECT_NO_THROW({
        LOG_TRACE("Test trace message");
        LOG_DEBUG("Test debug message with value: {}", 42);
        LOG_INFO("Test info message");
        LOG_WARN("Test warning message for task {}", "0b9c3c1e");
        LOG_ERROR("Test error message with code: {}", -1);
    });
}

TEST_F(LogSystemTest, CanFormatMultipleTypes) {
    EXPECT_NO_THROW({
        LOG_WARN("int={}, double={:.3f}, string={}, size={}", 100, 3.14159, std::string("hello"), size_t{7});
    });
}

TEST_F(LogSystemTest, CanChangeLogLevel) {
    getLogSystem()->setLevel(LogLevel::Error);
    EXPECT_EQ(getLogSystem()->level(), LogLevel::Error);

    getLogSystem()->setLevel(LogLevel::Trace);
    EXPECT_EQ(getLogSystem()->level(), LogLevel::Trace);
}

TEST_F(LogSystemTest, FatalThrowsException) {
    EXPECT_THROW({
        LOG_FATAL("This should throw an exception");
    }, std::runtime_error);
}

TEST_F(LogSystemTest, FatalMessageIsFormatted) {
    try {
        LOG_FATAL("store {} is gone", "redis");
        FAIL() << "LOG_FATAL did not throw";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "store redis is gone");
    }
}

TEST_F(LogSystemTest, UnopenableLogFileThrowsAndKeepsCurrentLogger) {
    LogSystemConfig config;
    config.loggerName = "docket-unopenable";
    config.filePath = "/dev/null/docket.log";

    try {
        LogSystem broken(config);
        FAIL() << "LogSystem opened " << config.filePath;
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("/dev/null/docket.log"), std::string::npos);
    }

    ASSERT_NE(getLogSystem(), nullptr);
    EXPECT_NO_THROW({
        LOG_WARN("Logging still works after a failed file sink");
    });
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Fatal);
}

TEST(LogLevelTest, RejectsUnknownNames) {
    EXPECT_FALSE(parseLogLevel("").has_value());
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Fatal}) {
        EXPECT_EQ(parseLogLevel(toString(level)), level);
    }
}

} // namespace test
} // namespace docket
