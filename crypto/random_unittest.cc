// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// RAND_set_rand_method() is deprecated in OpenSSL 3 but still routes
// RAND_bytes() through the installed method.
#define OPENSSL_SUPPRESS_DEPRECATED

#include "crypto/random.h"

#include <stddef.h>
#include <stdint.h>

#include <openssl/rand.h>

#include <algorithm>
#include <string>

#include "gtest/gtest.h"

// Basic functionality tests. Does NOT test the security of the random data.

namespace {

// Ensures we don't have all trivial data, i.e. that the data is indeed random.
// Currently, that means the bytes cannot be all the same (e.g. all zeros).
bool IsTrivial(const std::string& bytes) {
  const char first_byte = bytes.front();
  return std::all_of(bytes.begin(), bytes.end(),
                     [=](char byte) { return byte == first_byte; });
}

// A random source that always reports failure.
int FailingRandBytes(unsigned char* buf, int num) {
  return 0;
}

// Installs a failing random source. Only used inside death tests, so the
// change never reaches the parent process.
void BreakRandomSource() {
  static RAND_METHOD failing_method = {};
  failing_method.bytes = &FailingRandBytes;
  RAND_set_rand_method(&failing_method);
}

}  // namespace

TEST(RandBytes, RandBytes) {
  uint8_t bytes[16];
  crypto::RandBytes(bytes, sizeof(bytes));
  EXPECT_FALSE(IsTrivial(std::string(reinterpret_cast<char*>(bytes),
                                     sizeof(bytes))));
}

TEST(RandBytes, RandBytesAsString) {
  std::string random_string = crypto::RandBytesAsString(16);
  ASSERT_EQ(16u, random_string.size());
  EXPECT_FALSE(IsTrivial(random_string));
}

TEST(RandBytes, RandBytesAsStringIsFresh) {
  EXPECT_NE(crypto::RandBytesAsString(16), crypto::RandBytesAsString(16));
}

TEST(RandBytesDeathTest, FailureIsFatal) {
  EXPECT_DEATH(
      {
        BreakRandomSource();
        uint8_t bytes[16];
        crypto::RandBytes(bytes, sizeof(bytes));
      },
      "secure random source failed");
}

TEST(RandBytesDeathTest, FailureIsFatalForStrings) {
  EXPECT_DEATH(
      {
        BreakRandomSource();
        crypto::RandBytesAsString(16);
      },
      "secure random source failed");
}
