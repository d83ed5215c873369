// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/secure_hash.h"

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>

#include "crypto/sha2.h"
#include "gtest/gtest.h"

namespace {

struct HashCase {
  crypto::SecureHash::Algorithm algorithm;
  size_t hash_length;
};

class SecureHashTest : public testing::TestWithParam<HashCase> {};

std::string Digest(crypto::SecureHash::Algorithm algorithm,
                   const std::string& input,
                   size_t hash_length) {
  std::string output(hash_length, 0);
  std::unique_ptr<crypto::SecureHash> ctx(
      crypto::SecureHash::Create(algorithm));
  ctx->Update(input.data(), input.size());
  ctx->Finish(&output[0], output.size());
  return output;
}

}  // namespace

TEST_P(SecureHashTest, UpdateMatchesOneShot) {
  const HashCase& param = GetParam();
  // A long message fed in two halves.
  const std::string half(500000, 'a');

  std::string output(param.hash_length, 0);
  std::unique_ptr<crypto::SecureHash> ctx(
      crypto::SecureHash::Create(param.algorithm));
  ctx->Update(half.data(), half.size());
  ctx->Update(half.data(), half.size());
  ctx->Finish(&output[0], output.size());

  EXPECT_EQ(Digest(param.algorithm, half + half, param.hash_length), output);
}

TEST_P(SecureHashTest, EmptyUpdate) {
  const HashCase& param = GetParam();
  std::string output(param.hash_length, 0);
  std::unique_ptr<crypto::SecureHash> ctx(
      crypto::SecureHash::Create(param.algorithm));
  ctx->Update("", 0);
  ctx->Finish(&output[0], output.size());
  EXPECT_EQ(Digest(param.algorithm, std::string(), param.hash_length), output);
}

TEST_P(SecureHashTest, FinishTruncates) {
  const HashCase& param = GetParam();
  const std::string full = Digest(param.algorithm, "abc", param.hash_length);

  // Only the first 16 bytes are written; the guard byte stays untouched.
  std::string output(17, 0x42);
  std::unique_ptr<crypto::SecureHash> ctx(
      crypto::SecureHash::Create(param.algorithm));
  ctx->Update("abc", 3);
  ctx->Finish(&output[0], 16);
  EXPECT_EQ(full.substr(0, 16), output.substr(0, 16));
  EXPECT_EQ(0x42, output[16]);
}

TEST(SecureHashVectorTest, MatchesKnownDigests) {
  // Example B.3 from FIPS 180-2: long message, hashed in two halves.
  const std::string half(500000, 'a');
  const uint8_t expected_sha256[] = {
      0xcd, 0xc7, 0x6e, 0x5c, 0x99, 0x14, 0xfb, 0x92, 0x81, 0xa1, 0xc7,
      0xe2, 0x84, 0xd7, 0x3e, 0x67, 0xf1, 0x80, 0x9a, 0x48, 0xa4, 0x97,
      0x20, 0x0e, 0x04, 0x6d, 0x39, 0xcc, 0xc7, 0x11, 0x2c, 0xd0};
  // Example D.3 from FIPS 180-2.
  const uint8_t expected_sha384[] = {
      0x9d, 0x0e, 0x18, 0x09, 0x71, 0x64, 0x74, 0xcb, 0x08, 0x6e, 0x83,
      0x4e, 0x31, 0x0a, 0x4a, 0x1c, 0xed, 0x14, 0x9e, 0x9c, 0x00, 0xf2,
      0x48, 0x52, 0x79, 0x72, 0xce, 0xc5, 0x70, 0x4c, 0x2a, 0x5b, 0x07,
      0xb8, 0xb3, 0xdc, 0x38, 0xec, 0xc4, 0xeb, 0xae, 0x97, 0xdd, 0xd8,
      0x7f, 0x3d, 0x89, 0x85};

  std::string sha256(crypto::kSHA256Length, 0);
  std::unique_ptr<crypto::SecureHash> ctx(
      crypto::SecureHash::Create(crypto::SecureHash::SHA256));
  ctx->Update(half.data(), half.size());
  ctx->Update(half.data(), half.size());
  ctx->Finish(&sha256[0], sha256.size());
  EXPECT_EQ(std::string(reinterpret_cast<const char*>(expected_sha256),
                        sizeof(expected_sha256)),
            sha256);

  std::string sha384(crypto::kSHA384Length, 0);
  ctx = crypto::SecureHash::Create(crypto::SecureHash::SHA384);
  ctx->Update(half.data(), half.size());
  ctx->Update(half.data(), half.size());
  ctx->Finish(&sha384[0], sha384.size());
  EXPECT_EQ(std::string(reinterpret_cast<const char*>(expected_sha384),
                        sizeof(expected_sha384)),
            sha384);
}

INSTANTIATE_TEST_SUITE_P(
    All,
    SecureHashTest,
    testing::Values(HashCase{crypto::SecureHash::SHA256, crypto::kSHA256Length},
                    HashCase{crypto::SecureHash::SHA384, crypto::kSHA384Length},
                    HashCase{crypto::SecureHash::SHA512,
                             crypto::kSHA512Length}));

TEST(SecureHashDeathTest, UnsupportedAlgorithm) {
  EXPECT_DEATH(crypto::SecureHash::Create(
                   static_cast<crypto::SecureHash::Algorithm>(7)),
               "Unsupported hash algorithm 7");
}
