// Copyright 2011 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/logging.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace logging {

namespace {

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::StartsWith;

struct CapturedMessage {
  int severity;
  std::string text;
};

std::vector<CapturedMessage>* g_captured = nullptr;

bool CaptureHandler(int severity,
                    const char* file,
                    int line,
                    size_t message_start,
                    const std::string& str) {
  g_captured->push_back({severity, str});
  return true;
}

class LoggingTest : public testing::Test {
 protected:
  void SetUp() override {
    old_min_log_level_ = GetMinLogLevel();
    old_handler_ = GetLogMessageHandler();
    g_captured = &captured_;
    SetLogMessageHandler(&CaptureHandler);
  }

  void TearDown() override {
    SetLogMessageHandler(old_handler_);
    g_captured = nullptr;
    SetMinLogLevel(old_min_log_level_);
    SetVlogLevel(0);
  }

  std::vector<CapturedMessage> captured_;

 private:
  int old_min_log_level_;
  LogMessageHandlerFunction old_handler_;
};

int g_side_effects = 0;

int SideEffect() {
  return ++g_side_effects;
}

}  // namespace

TEST_F(LoggingTest, MessageFormat) {
  SetMinLogLevel(LOGGING_INFO);
  LOG(WARNING) << "directive " << 3;

  ASSERT_EQ(1u, captured_.size());
  EXPECT_EQ(LOGGING_WARNING, captured_[0].severity);
  EXPECT_THAT(captured_[0].text, StartsWith("[WARNING:logging_unittest.cc("));
  EXPECT_THAT(captured_[0].text, EndsWith(")] directive 3\n"));
}

TEST_F(LoggingTest, BasicLogging) {
  SetMinLogLevel(LOGGING_WARNING);
  EXPECT_FALSE(LOG_IS_ON(INFO));
  EXPECT_TRUE(LOG_IS_ON(WARNING));
  EXPECT_TRUE(LOG_IS_ON(FATAL));

  g_side_effects = 0;
  LOG(INFO) << SideEffect();
  LOG_IF(INFO, true) << SideEffect();
  EXPECT_EQ(0, g_side_effects);
  EXPECT_TRUE(captured_.empty());

  LOG(ERROR) << SideEffect();
  LOG_IF(ERROR, false) << SideEffect();
  LOG_IF(ERROR, true) << SideEffect();
  EXPECT_EQ(2, g_side_effects);
  ASSERT_EQ(2u, captured_.size());
  EXPECT_EQ(LOGGING_ERROR, captured_[1].severity);
}

TEST_F(LoggingTest, MinLogLevelIsClampedToFatal) {
  SetMinLogLevel(LOGGING_FATAL + 5);
  EXPECT_EQ(LOGGING_FATAL, GetMinLogLevel());
  EXPECT_FALSE(LOG_IS_ON(ERROR));
}

TEST_F(LoggingTest, InitLogging) {
  LoggingSettings settings;
  settings.min_log_level = LOGGING_ERROR;
  settings.vlog_level = 2;
  EXPECT_TRUE(InitLogging(settings));
  EXPECT_EQ(LOGGING_ERROR, GetMinLogLevel());
  EXPECT_EQ(2, GetVlogVerbosity());

  settings.min_log_level = LOGGING_NUM_SEVERITIES;
  EXPECT_FALSE(InitLogging(settings));
  EXPECT_EQ(LOGGING_ERROR, GetMinLogLevel());
}

TEST_F(LoggingTest, VerboseLogging) {
  SetMinLogLevel(LOGGING_INFO);
  SetVlogLevel(1);
  VLOG(1) << "compiled";
  VLOG(2) << "dropped";
  VLOG_IF(1, false) << "dropped";

  ASSERT_EQ(1u, captured_.size());
  EXPECT_EQ(-1, captured_[0].severity);
  EXPECT_THAT(captured_[0].text, StartsWith("[VERBOSE1:"));
  EXPECT_THAT(captured_[0].text, HasSubstr("compiled"));
}

TEST_F(LoggingTest, NegativeMinLogLevelEnablesVerboseLogging) {
  SetVlogLevel(0);
  SetMinLogLevel(-2);
  EXPECT_EQ(2, GetVlogVerbosity());
  EXPECT_TRUE(VLOG_IS_ON(2));
  EXPECT_FALSE(VLOG_IS_ON(3));
}

TEST_F(LoggingTest, CheckPassesSilently) {
  g_side_effects = 0;
  CHECK(SideEffect() == 1) << "not evaluated";
  CHECK_EQ(2, SideEffect());
  CHECK_LT(0u, 1u);
  EXPECT_EQ(2, g_side_effects);
  EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggingTest, DcheckStreamIsNotEvaluatedOnSuccess) {
  g_side_effects = 0;
  DCHECK(true) << SideEffect();
  DCHECK_EQ(1, 1) << SideEffect();
  EXPECT_EQ(0, g_side_effects);
}

TEST(LoggingDeathTest, Check) {
  EXPECT_DEATH(CHECK(1 == 2) << "custom", "Check failed: 1 == 2. custom");
}

TEST(LoggingDeathTest, CheckOp) {
  int nonce_length = 8;
  EXPECT_DEATH(CHECK_GE(nonce_length, 16),
               "Check failed: nonce_length >= 16 \\(8 vs. 16\\)");
}

TEST(LoggingDeathTest, Fatal) {
  EXPECT_DEATH(LOG(FATAL) << "fatal message", "fatal message");
}

TEST(LoggingDeathTest, NotReached) {
  EXPECT_DEATH(NOTREACHED() << "unexpected", "NOTREACHED hit. unexpected");
}

#if DCHECK_IS_ON()
TEST(LoggingDeathTest, Dcheck) {
  EXPECT_DEATH(DCHECK(false) << "debug only", "Check failed: false. debug only");
}
#endif

}  // namespace logging
