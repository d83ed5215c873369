// Copyright 2013 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/strings/string_util.h"

#include <stddef.h>

#include <iterator>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace base {

TEST(StringUtilTest, ReplaceSubstringsAfterOffset) {
  static const struct {
    const char* str;
    size_t start_offset;
    const char* find_this;
    const char* replace_with;
    const char* expected;
    size_t expected_replacements;
  } cases[] = {
    {"aaa", 0, "a", "b", "bbb", 3},
    {"abb", 0, "ab", "a", "ab", 1},
    {"Removing some substrings inging", 0, "ing", "", "Remov some substrs ",
     4},
    {"Not found", 0, "x", "0", "Not found", 0},
    {"Not found again", 5, "x", "0", "Not found again", 0},
    {" Making it much longer ", 0, " ", "Four score and seven years ago",
     "Four score and seven years agoMakingFour score and seven years agoit"
     "Four score and seven years agomuchFour score and seven years agolonger"
     "Four score and seven years ago", 5},
    {"Invalid offset", 9999, "t", "foobar", "Invalid offset", 0},
    {"Replace me only me once", 9, "me ", "", "Replace me only once", 1},
    {"abababab", 2, "ab", "c", "abccc", 3},
    {"script-src $NONCE;style-src $NONCE", 0, "$NONCE", "'nonce-abc'",
     "script-src 'nonce-abc';style-src 'nonce-abc'", 2},
  };

  for (size_t i = 0; i < std::size(cases); i++) {
    std::string str = cases[i].str;
    size_t replacements =
        ReplaceSubstringsAfterOffset(&str, cases[i].start_offset,
                                     cases[i].find_this,
                                     cases[i].replace_with);
    EXPECT_EQ(cases[i].expected, str) << "case " << i;
    EXPECT_EQ(cases[i].expected_replacements, replacements) << "case " << i;
  }
}

TEST(StringUtilTest, ReplaceSubstringsIgnoresEmptyPattern) {
  std::string str = "unchanged";
  EXPECT_EQ(0u, ReplaceSubstringsAfterOffset(&str, 0, "", "x"));
  EXPECT_EQ("unchanged", str);
}

TEST(StringUtilTest, EndsWith) {
  EXPECT_TRUE(EndsWith("Foo.plugin", ".plugin"));
  EXPECT_FALSE(EndsWith("Foo.Plugin", ".plugin"));
  EXPECT_FALSE(EndsWith(".plug", ".plugin"));
  EXPECT_FALSE(EndsWith("Foo.plugin Bar", ".plugin"));
  EXPECT_FALSE(EndsWith(std::string(), ".plugin"));
  EXPECT_TRUE(EndsWith("Foo.plugin", std::string()));
  EXPECT_TRUE(EndsWith(".plugin", ".plugin"));
  EXPECT_TRUE(EndsWith("img-src *;", ";"));
}

TEST(StringUtilTest, JoinString) {
  std::string separator(", ");
  std::vector<std::string> parts;
  EXPECT_EQ(std::string(), JoinString(parts, separator));

  parts.push_back(std::string());
  EXPECT_EQ(std::string(), JoinString(parts, separator));
  parts.clear();

  parts.push_back("a");
  EXPECT_EQ("a", JoinString(parts, separator));

  parts.push_back("b");
  parts.push_back("c");
  EXPECT_EQ("a, b, c", JoinString(parts, separator));

  parts.push_back(std::string());
  EXPECT_EQ("a, b, c, ", JoinString(parts, separator));
  parts.push_back(" ");
  EXPECT_EQ("a|b|c|| ", JoinString(parts, "|"));
}

TEST(StringUtilTest, JoinStringPiece) {
  std::vector<std::string_view> parts;
  EXPECT_EQ(std::string(), JoinString(parts, " "));

  parts.push_back("'self'");
  parts.push_back("data:");
  EXPECT_EQ("'self' data:", JoinString(parts, " "));
}

TEST(StringUtilTest, JoinStringInitializerList) {
  std::string separator(", ");
  EXPECT_EQ(std::string(), JoinString({}, separator));

  // With std::string_view elements.
  EXPECT_EQ("a", JoinString({"a"}, separator));
  EXPECT_EQ("a, b, c", JoinString({"a", "b", "c"}, separator));
}

}  // namespace base
