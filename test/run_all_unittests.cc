// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/logging.h"
#include "gtest/gtest.h"

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);

  // Death tests fork; the "threadsafe" style re-executes the binary so that
  // the child does not inherit state from other tests.
  ::testing::GTEST_FLAG(death_test_style) = "threadsafe";

  // Run this here instead of in a fixture so that every test sees the same
  // logging configuration.
  logging::LoggingSettings settings;
  settings.min_log_level = logging::LOGGING_WARNING;
  CHECK(logging::InitLogging(settings));

  return RUN_ALL_TESTS();
}
