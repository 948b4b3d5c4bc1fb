#include <gtest/gtest.h>

#include "common/utils/LoggerManager.hpp"

namespace {

std::string format(const std::string& raw) {
    return LoggerManager::formatLogMessage(raw.c_str(), raw.size());
}

}  // namespace

TEST(LoggerManagerTest, ReformatsTrantorLine) {
    std::string raw = "20261019 08:15:42.123456 UTC 1234 INFO  [Pzem] Session opened - Meter.Session.hpp:68\n";
    EXPECT_EQ(format(raw), "2026-10-19 08:15:42 UTC 1234 INFO  [Pzem] Session opened\n");
}

TEST(LoggerManagerTest, StripsLambdaFunctionName) {
    std::string raw = "20261019 08:15:42.123456 1234 DEBUG [operator ()] [Pzem] TX F8 04 - main.cpp:10\n";
    EXPECT_EQ(format(raw), "2026-10-19 08:15:42 1234 DEBUG [Pzem] TX F8 04\n");
}

TEST(LoggerManagerTest, KeepsUnrecognizedLinesUntouched) {
    EXPECT_EQ(format("short"), "short");
    EXPECT_EQ(format("not a trantor log line at all"), "not a trantor log line at all");
}

TEST(LoggerManagerTest, LogLevelNames) {
    EXPECT_TRUE(LoggerManager::isValidLogLevel("TRACE"));
    EXPECT_TRUE(LoggerManager::isValidLogLevel("FATAL"));
    EXPECT_FALSE(LoggerManager::isValidLogLevel("info"));
    EXPECT_FALSE(LoggerManager::isValidLogLevel(""));
}

TEST(LoggerManagerTest, SetLogLevelRejectsUnknownName) {
    EXPECT_TRUE(LoggerManager::setLogLevel("DEBUG"));
    EXPECT_EQ(trantor::Logger::logLevel(), trantor::Logger::kDebug);

    EXPECT_FALSE(LoggerManager::setLogLevel("VERBOSE"));
    EXPECT_EQ(trantor::Logger::logLevel(), trantor::Logger::kDebug);

    LoggerManager::setLogLevel("INFO");
}
