// Repository: Lockstep
// Component: Logger unit tests

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "lockstep/util/Logger.hpp"

namespace lockstep::util {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetCaptureSink([this](LogLevel level, const std::string& line) {
      captured_.emplace_back(level, line);
    });
  }

  void TearDown() override {
    Logger::SetCaptureSink(nullptr);
    Logger::SetDebugEnabled(false);
  }

  std::vector<std::pair<LogLevel, std::string>> captured_;
};

TEST_F(LoggerTest, CaptureSinkSeesEveryLevelWithItsTag) {
  Logger::SetDebugEnabled(false);
  Logger::Info("[LoggerTest] INFO_LINE");
  Logger::Warn("[LoggerTest] WARN_LINE");
  Logger::Error("[LoggerTest] ERROR_LINE");

  ASSERT_EQ(captured_.size(), 3u);
  EXPECT_EQ(captured_[0].first, LogLevel::kInfo);
  EXPECT_EQ(captured_[1].first, LogLevel::kWarn);
  EXPECT_EQ(captured_[2].first, LogLevel::kError);
  EXPECT_EQ(captured_[2].second, "[LoggerTest] ERROR_LINE");
}

TEST_F(LoggerTest, DebugLinesOnlyWhileEnabled) {
  Logger::SetDebugEnabled(false);
  EXPECT_FALSE(Logger::DebugEnabled());
  Logger::Debug("[LoggerTest] HIDDEN");
  EXPECT_TRUE(captured_.empty());

  Logger::SetDebugEnabled(true);
  EXPECT_TRUE(Logger::DebugEnabled());
  Logger::Debug("[LoggerTest] SHOWN");
  ASSERT_EQ(captured_.size(), 1u);
  EXPECT_EQ(captured_[0].first, LogLevel::kDebug);
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(LogLevelName(LogLevel::kDebug), "DEBUG");
  EXPECT_STREQ(LogLevelName(LogLevel::kError), "ERROR");
}

}  // namespace
}  // namespace lockstep::util
