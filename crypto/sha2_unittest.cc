// Copyright 2011 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/sha2.h"

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "gtest/gtest.h"

namespace {

std::string ToString(const uint8_t* bytes, size_t length) {
  return std::string(reinterpret_cast<const char*>(bytes), length);
}

}  // namespace

TEST(Sha256Test, Empty) {
  const uint8_t expected[] = {
      0xe3, 0xb0, 0xc4, 0x42, 0x98, 0xfc, 0x1c, 0x14, 0x9a, 0xfb, 0xf4,
      0xc8, 0x99, 0x6f, 0xb9, 0x24, 0x27, 0xae, 0x41, 0xe4, 0x64, 0x9b,
      0x93, 0x4c, 0xa4, 0x95, 0x99, 0x1b, 0x78, 0x52, 0xb8, 0x55,
  };

  const std::string hash = crypto::SHA256HashString(std::string());
  ASSERT_EQ(crypto::kSHA256Length, hash.size());
  EXPECT_EQ(ToString(expected, sizeof(expected)), hash);
}

TEST(Sha256Test, Test1) {
  // Example B.1 from FIPS 180-2: one-block message.
  const std::string input = "abc";
  const uint8_t expected[] = {
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40,
      0xde, 0x5d, 0xae, 0x22, 0x23, 0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17,
      0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad,
  };

  const std::string hash = crypto::SHA256HashString(input);
  ASSERT_EQ(crypto::kSHA256Length, hash.size());
  EXPECT_EQ(ToString(expected, sizeof(expected)), hash);
}

TEST(Sha256Test, Test2) {
  // Example B.2 from FIPS 180-2: multi-block message.
  const std::string input2 =
      "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
  const uint8_t expected[] = {
      0x24, 0x8d, 0x6a, 0x61, 0xd2, 0x06, 0x38, 0xb8, 0xe5, 0xc0, 0x26,
      0x93, 0x0c, 0x3e, 0x60, 0x39, 0xa3, 0x3c, 0xe4, 0x59, 0x64, 0xff,
      0x21, 0x67, 0xf6, 0xec, 0xed, 0xd4, 0x19, 0xdb, 0x06, 0xc1,
  };

  EXPECT_EQ(ToString(expected, sizeof(expected)),
            crypto::SHA256HashString(input2));
}

TEST(Sha256Test, Test3) {
  // Example B.3 from FIPS 180-2: long message.
  const std::string input3(1000000, 'a');  // 'a' repeated a million times
  const uint8_t expected[] = {
      0xcd, 0xc7, 0x6e, 0x5c, 0x99, 0x14, 0xfb, 0x92, 0x81, 0xa1, 0xc7,
      0xe2, 0x84, 0xd7, 0x3e, 0x67, 0xf1, 0x80, 0x9a, 0x48, 0xa4, 0x97,
      0x20, 0x0e, 0x04, 0x6d, 0x39, 0xcc, 0xc7, 0x11, 0x2c, 0xd0,
  };

  EXPECT_EQ(ToString(expected, sizeof(expected)),
            crypto::SHA256HashString(input3));
}

TEST(Sha384Test, Test1) {
  // Example D.1 from FIPS 180-2: one-block message.
  const uint8_t expected[] = {
      0xcb, 0x00, 0x75, 0x3f, 0x45, 0xa3, 0x5e, 0x8b, 0xb5, 0xa0, 0x3d,
      0x69, 0x9a, 0xc6, 0x50, 0x07, 0x27, 0x2c, 0x32, 0xab, 0x0e, 0xde,
      0xd1, 0x63, 0x1a, 0x8b, 0x60, 0x5a, 0x43, 0xff, 0x5b, 0xed, 0x80,
      0x86, 0x07, 0x2b, 0xa1, 0xe7, 0xcc, 0x23, 0x58, 0xba, 0xec, 0xa1,
      0x34, 0xc8, 0x25, 0xa7,
  };

  const std::string hash = crypto::SHA384HashString("abc");
  ASSERT_EQ(crypto::kSHA384Length, hash.size());
  EXPECT_EQ(ToString(expected, sizeof(expected)), hash);
}

TEST(Sha512Test, Test1) {
  // Example C.1 from FIPS 180-2: one-block message.
  const uint8_t expected[] = {
      0xdd, 0xaf, 0x35, 0xa1, 0x93, 0x61, 0x7a, 0xba, 0xcc, 0x41, 0x73,
      0x49, 0xae, 0x20, 0x41, 0x31, 0x12, 0xe6, 0xfa, 0x4e, 0x89, 0xa9,
      0x7e, 0xa2, 0x0a, 0x9e, 0xee, 0xe6, 0x4b, 0x55, 0xd3, 0x9a, 0x21,
      0x92, 0x99, 0x2a, 0x27, 0x4f, 0xc1, 0xa8, 0x36, 0xba, 0x3c, 0x23,
      0xa3, 0xfe, 0xeb, 0xbd, 0x45, 0x4d, 0x44, 0x23, 0x64, 0x3c, 0xe8,
      0x0e, 0x2a, 0x9a, 0xc9, 0x4f, 0xa5, 0x4c, 0xa4, 0x9f,
  };

  const std::string hash = crypto::SHA512HashString("abc");
  ASSERT_EQ(crypto::kSHA512Length, hash.size());
  EXPECT_EQ(ToString(expected, sizeof(expected)), hash);
}
