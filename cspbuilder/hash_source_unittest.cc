// Copyright 2025 The Cobalt Authors. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "cspbuilder/hash_source.h"

#include "base/base64.h"
#include "gtest/gtest.h"

namespace cspbuilder {

TEST(HashSourceTest, Sha256) {
  EXPECT_EQ("'sha256-bnQkgwAfjTxnZSlFxZe1ogJadBHLnRuuL54WC+v+tMY='",
            ComputeHashSource(HashAlgorithm::kSha256, "doSomething()"));
  EXPECT_EQ("'sha256-qznLcsROx4GACP2dm0UCKCzCG+HiZ1guq6ZZDob/Tng='",
            ComputeHashSource(HashAlgorithm::kSha256,
                              "alert('Hello, world.');"));
}

TEST(HashSourceTest, Sha384) {
  EXPECT_EQ(
      "'sha384-dSqwbwJ4vxDFs8ne2pSOBhHNwihu/KRzIyGFwWxPxkg5JENkalTS+CojHexZI3wT'",
      ComputeHashSource(HashAlgorithm::kSha384, "doSomething()"));
  EXPECT_EQ(
      "'sha384-H8BRh8j48O9oYatfu5AZzq6A9RINhZO5H16dQZngK7T62em8MUt1FLm52t+eX6xO'",
      ComputeHashSource(HashAlgorithm::kSha384, "alert('Hello, world.');"));
}

TEST(HashSourceTest, Sha512) {
  EXPECT_EQ(
      "'sha512-NrS2FABurNzIW2yTKRxF8X+HMhJh29vd9syOLut1MW4Cd1JeGzZqughLzC+LQr0O"
      "8XFhCuR4zyjLgrTQct7jAA=='",
      ComputeHashSource(HashAlgorithm::kSha512, "doSomething()"));
}

TEST(HashSourceTest, EmptyContent) {
  EXPECT_EQ("'sha256-47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU='",
            ComputeHashSource(HashAlgorithm::kSha256, ""));
}

TEST(HashSourceTest, HashesExactBytes) {
  // Whitespace is significant: browsers hash the element text verbatim.
  EXPECT_NE(ComputeHashSource(HashAlgorithm::kSha256, "doSomething()"),
            ComputeHashSource(HashAlgorithm::kSha256, "doSomething();"));
  EXPECT_NE(ComputeHashSource(HashAlgorithm::kSha256, "doSomething()"),
            ComputeHashSource(HashAlgorithm::kSha256, " doSomething()"));
}

TEST(HashSourceTest, DigestLengthMatchesAlgorithm) {
  static const struct {
    HashAlgorithm algorithm;
    const char* prefix;
    size_t digest_length;
  } cases[] = {
      {HashAlgorithm::kSha256, "'sha256-", 32},
      {HashAlgorithm::kSha384, "'sha384-", 48},
      {HashAlgorithm::kSha512, "'sha512-", 64},
  };

  for (const auto& test_case : cases) {
    std::string source = ComputeHashSource(test_case.algorithm, "script");
    const std::string prefix = test_case.prefix;
    ASSERT_EQ(0u, source.find(prefix));
    ASSERT_EQ('\'', source.back());

    std::string digest;
    ASSERT_TRUE(base::Base64Decode(
        source.substr(prefix.size(), source.size() - prefix.size() - 1),
        &digest));
    EXPECT_EQ(test_case.digest_length, digest.size()) << prefix;
  }
}

TEST(HashSourceDeathTest, UnsupportedAlgorithm) {
  EXPECT_DEATH(ComputeHashSource(static_cast<HashAlgorithm>(1), "content"),
               "Unsupported hash algorithm 1");
}

}  // namespace cspbuilder
