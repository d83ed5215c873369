// Copyright 2011 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/sha2.h"

#include <memory>

#include "crypto/secure_hash.h"

namespace crypto {

namespace {

std::string HashString(SecureHash::Algorithm algorithm,
                       std::string_view str,
                       size_t length) {
  std::string output(length, 0);
  std::unique_ptr<SecureHash> ctx(SecureHash::Create(algorithm));
  ctx->Update(str.data(), str.length());
  ctx->Finish(&output[0], output.size());
  return output;
}

}  // namespace

std::string SHA256HashString(std::string_view str) {
  return HashString(SecureHash::SHA256, str, kSHA256Length);
}

std::string SHA384HashString(std::string_view str) {
  return HashString(SecureHash::SHA384, str, kSHA384Length);
}

std::string SHA512HashString(std::string_view str) {
  return HashString(SecureHash::SHA512, str, kSHA512Length);
}

}  // namespace crypto
