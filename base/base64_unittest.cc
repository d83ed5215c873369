// Copyright 2011 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/base64.h"

#include "gtest/gtest.h"

namespace base {

TEST(Base64Test, Basic) {
  const std::string kText = "hello world";
  const std::string kBase64Text = "aGVsbG8gd29ybGQ=";

  std::string encoded;
  std::string decoded;
  bool ok;

  Base64Encode(kText, &encoded);
  EXPECT_EQ(kBase64Text, encoded);

  ok = Base64Decode(encoded, &decoded);
  EXPECT_TRUE(ok);
  EXPECT_EQ(kText, decoded);
}

TEST(Base64Test, ReturnsEncodedString) {
  EXPECT_EQ("", Base64Encode(""));
  EXPECT_EQ("Zg==", Base64Encode("f"));
  EXPECT_EQ("Zm8=", Base64Encode("fo"));
  EXPECT_EQ("Zm9v", Base64Encode("foo"));
  EXPECT_EQ("Zm9vYg==", Base64Encode("foob"));
}

TEST(Base64Test, BinaryData) {
  const std::string kBinary("\x00\xff\xfe\x80\x7f", 5);
  std::string encoded = Base64Encode(kBinary);
  EXPECT_EQ("AP/+gH8=", encoded);

  std::string decoded;
  ASSERT_TRUE(Base64Decode(encoded, &decoded));
  EXPECT_EQ(kBinary, decoded);
}

TEST(Base64Test, InPlace) {
  const std::string kText = "hello world";
  const std::string kBase64Text = "aGVsbG8gd29ybGQ=";
  std::string text(kText);

  Base64Encode(text, &text);
  EXPECT_EQ(kBase64Text, text);

  bool ok = Base64Decode(text, &text);
  EXPECT_TRUE(ok);
  EXPECT_EQ(text, kText);
}

TEST(Base64Test, RejectsMalformedInput) {
  const std::string kUntouched = "untouched";
  std::string output = kUntouched;

  // Missing padding.
  EXPECT_FALSE(Base64Decode("aGVsbG8gd29ybGQ", &output));
  // Padding in the middle.
  EXPECT_FALSE(Base64Decode("aG=sbG8gd29ybGQ=", &output));
  // Too much padding.
  EXPECT_FALSE(Base64Decode("a===", &output));
  // Characters outside the alphabet.
  EXPECT_FALSE(Base64Decode("aGVs*G8=", &output));
  // Whitespace.
  EXPECT_FALSE(Base64Decode(" aGVsbG8gd29ybGQ=", &output));
  EXPECT_FALSE(Base64Decode("aGV sbG8", &output));
  EXPECT_FALSE(Base64Decode(" aGVsbG8gd29ybG=", &output));

  EXPECT_EQ(kUntouched, output);
}

TEST(Base64Test, EmptyInput) {
  std::string output = "untouched";
  EXPECT_TRUE(Base64Decode("", &output));
  EXPECT_EQ("", output);
}

}  // namespace base
