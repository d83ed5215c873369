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

#ifndef CSPBUILDER_HASH_SOURCE_H_
#define CSPBUILDER_HASH_SOURCE_H_

#include <string>
#include <string_view>

#include "cspbuilder/cspbuilder_export.h"

namespace cspbuilder {

// Digest algorithms a hash-source may name. The enumerator values are the
// digest sizes in bits, which is also how they appear in the source literal.
enum class HashAlgorithm {
  kSha256 = 256,
  kSha384 = 384,
  kSha512 = 512,
};

// Returns the hash-source literal for |content|, e.g.
//   ComputeHashSource(HashAlgorithm::kSha256, "alert(1)")
// returns "'sha256-<base64 of the SHA-256 digest>'". The digest covers the
// exact bytes of |content| and the base64 uses the standard alphabet with
// padding. An algorithm outside the enum is fatal.
CSPBUILDER_EXPORT std::string ComputeHashSource(HashAlgorithm algorithm,
                                                std::string_view content);

}  // namespace cspbuilder

#endif  // CSPBUILDER_HASH_SOURCE_H_
