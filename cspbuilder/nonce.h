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

#ifndef CSPBUILDER_NONCE_H_
#define CSPBUILDER_NONCE_H_

#include <stddef.h>

#include <string>
#include <string_view>

#include "cspbuilder/cspbuilder_export.h"

namespace cspbuilder {

// Number of random bytes behind every nonce.
constexpr size_t kNonceLengthInBytes = 16;

// Returns a fresh nonce: kNonceLengthInBytes bytes from the secure random
// source, base64url-encoded without padding. Every call draws new bytes.
// A random source failure is fatal.
CSPBUILDER_EXPORT std::string GenerateNonce();

// Returns the nonce-source literal "'nonce-<nonce>'".
CSPBUILDER_EXPORT std::string FormatNonceSource(std::string_view nonce);

}  // namespace cspbuilder

#endif  // CSPBUILDER_NONCE_H_
