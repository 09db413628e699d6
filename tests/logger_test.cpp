#include "logger.hpp"
#include <gtest/gtest.h>

namespace tproxy {
namespace {

TEST(LoggerTest, LevelCanBeChanged) {
    LogLevel previous = Logger::getLevel();

    Logger::setLevel(LogLevel::Debug);
    EXPECT_EQ(Logger::getLevel(), LogLevel::Debug);
    Logger::setLevel(LogLevel::None);
    EXPECT_EQ(Logger::getLevel(), LogLevel::None);

    Logger::setLevel(previous);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelToString(LogLevel::Error), "ERROR");
    EXPECT_EQ(Logger::levelToString(LogLevel::Warning), "WARNING");
    EXPECT_EQ(Logger::levelToString(LogLevel::Info), "INFO");
    EXPECT_EQ(Logger::levelToString(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(Logger::levelToString(LogLevel::None), "NONE");
}

} // namespace
} // namespace tproxy
