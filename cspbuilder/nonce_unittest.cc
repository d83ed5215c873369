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


#include "cspbuilder/nonce.h"

#include <set>
#include <string>

#include "base/base64url.h"
#include "gtest/gtest.h"

namespace cspbuilder {

TEST(NonceTest, DecodesToSixteenBytes) {
  std::string nonce = GenerateNonce();
  // 16 bytes encode to 22 characters once padding is dropped.
  EXPECT_EQ(22u, nonce.size());
  EXPECT_EQ(std::string::npos, nonce.find('='));

  std::string decoded;
  ASSERT_TRUE(base::Base64UrlDecode(
      nonce, base::Base64UrlDecodePolicy::DISALLOW_PADDING, &decoded));
  EXPECT_EQ(kNonceLengthInBytes, decoded.size());
}

TEST(NonceTest, IsFreshOnEveryCall) {
  std::set<std::string> nonces;
  for (int i = 0; i < 64; ++i)
    EXPECT_TRUE(nonces.insert(GenerateNonce()).second);
}

TEST(NonceTest, UsesUrlSafeAlphabet) {
  for (int i = 0; i < 64; ++i) {
    std::string nonce = GenerateNonce();
    EXPECT_EQ(std::string::npos, nonce.find_first_of("+/=")) << nonce;
  }
}

TEST(NonceTest, FormatNonceSource) {
  EXPECT_EQ("'nonce-abc123'", FormatNonceSource("abc123"));
  EXPECT_EQ("'nonce-'", FormatNonceSource(""));
}

}  // namespace cspbuilder
