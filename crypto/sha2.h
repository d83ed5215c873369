// Copyright 2011 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef CRYPTO_SHA2_H_
#define CRYPTO_SHA2_H_

#include <stddef.h>

#include <string>
#include <string_view>

#include "crypto/crypto_export.h"

namespace crypto {

// These functions perform SHA-256, SHA-384 and SHA-512 operations.

static const size_t kSHA256Length = 32;  // Length in bytes of a SHA-256 hash.
static const size_t kSHA384Length = 48;  // Length in bytes of a SHA-384 hash.
static const size_t kSHA512Length = 64;  // Length in bytes of a SHA-512 hash.

// Return the raw digest of |str| in a string of the full digest length.
CRYPTO_EXPORT std::string SHA256HashString(std::string_view str);
CRYPTO_EXPORT std::string SHA384HashString(std::string_view str);
CRYPTO_EXPORT std::string SHA512HashString(std::string_view str);

}  // namespace crypto

#endif  // CRYPTO_SHA2_H_
