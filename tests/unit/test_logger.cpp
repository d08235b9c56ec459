#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <string>

using namespace cdp::common;

TEST(LoggerTest, TimestampedLogPathUnderDirectory) {
  const std::string sPath = Logger::timestampedLogPath("logs");
  EXPECT_TRUE(std::regex_match(sPath, std::regex(R"(logs/deployment-\d{8}_\d{6}\.log)")))
      << sPath;
}

TEST(LoggerTest, GetAlwaysReturnsLogger) {
  EXPECT_NE(Logger::get(), nullptr);
}
