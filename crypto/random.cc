// Copyright 2013 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/random.h"

#include <limits.h>
#include <stdint.h>

#include <openssl/rand.h>

#include "base/logging.h"
#include "crypto/openssl_util.h"

namespace crypto {

void RandBytes(void* bytes, size_t length) {
  DCHECK_GT(length, 0u);
  CHECK_LE(length, static_cast<size_t>(INT_MAX));

  OpenSSLErrStackTracer err_tracer(__FILE__, __LINE__);
  CHECK_EQ(1, RAND_bytes(static_cast<uint8_t*>(bytes),
                         static_cast<int>(length)))
      << "secure random source failed";
}

std::string RandBytesAsString(size_t length) {
  std::string result;
  if (length == 0)
    return result;
  result.resize(length);
  RandBytes(&result[0], length);
  return result;
}

}  // namespace crypto
