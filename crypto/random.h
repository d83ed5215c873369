// Copyright 2013 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef CRYPTO_RANDOM_H_
#define CRYPTO_RANDOM_H_

#include <stddef.h>

#include <string>

#include "crypto/crypto_export.h"

namespace crypto {

// Fills the given buffer with |length| random bytes of cryptographically
// secure random numbers.
// |length| must be positive.
// A failure of the underlying generator is fatal; this never returns
// partially filled or predictable output.
CRYPTO_EXPORT void RandBytes(void* bytes, size_t length);

// Returns a string of |length| cryptographically secure random bytes.
CRYPTO_EXPORT std::string RandBytesAsString(size_t length);

}  // namespace crypto

#endif  // CRYPTO_RANDOM_H_
