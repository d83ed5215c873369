// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/secure_hash.h"

#include <openssl/evp.h>

#include "base/logging.h"
#include "crypto/openssl_util.h"

namespace crypto {

namespace {

using ScopedEVP_MD_CTX = ScopedOpenSSL<EVP_MD_CTX, EVP_MD_CTX_free>;

class SecureHashEVP : public SecureHash {
 public:
  explicit SecureHashEVP(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
    CHECK(ctx_);
    CHECK_EQ(1, EVP_DigestInit_ex(ctx_.get(), md, nullptr));
  }

  SecureHashEVP(const SecureHashEVP&) = delete;
  SecureHashEVP& operator=(const SecureHashEVP&) = delete;

  ~SecureHashEVP() override = default;

  void Update(const void* input, size_t len) override {
    OpenSSLErrStackTracer err_tracer(__FILE__, __LINE__);
    CHECK_EQ(1, EVP_DigestUpdate(ctx_.get(), input, len));
  }

  void Finish(void* output, size_t len) override {
    OpenSSLErrStackTracer err_tracer(__FILE__, __LINE__);
    ScopedOpenSSLSafeSizeBuffer<EVP_MAX_MD_SIZE> result(
        static_cast<unsigned char*>(output), len);
    CHECK_EQ(1, EVP_DigestFinal_ex(ctx_.get(), result.safe_buffer(), nullptr));
  }

 private:
  ScopedEVP_MD_CTX ctx_;
};

}  // namespace

std::unique_ptr<SecureHash> SecureHash::Create(Algorithm algorithm) {
  switch (algorithm) {
    case SHA256:
      return std::make_unique<SecureHashEVP>(EVP_sha256());
    case SHA384:
      return std::make_unique<SecureHashEVP>(EVP_sha384());
    case SHA512:
      return std::make_unique<SecureHashEVP>(EVP_sha512());
  }
  NOTREACHED() << "Unsupported hash algorithm " << static_cast<int>(algorithm);
  return nullptr;
}

}  // namespace crypto
