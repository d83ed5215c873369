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
#include "base/logging.h"
#include "crypto/sha2.h"

namespace cspbuilder {

namespace {

std::string FormatHashSource(std::string_view prefix,
                             const std::string& digest) {
  std::string encoded = base::Base64Encode(digest);

  std::string source;
  source.reserve(prefix.size() + encoded.size() + 2);
  source.push_back('\'');
  source.append(prefix);
  source.append(encoded);
  source.push_back('\'');
  return source;
}

}  // namespace

std::string ComputeHashSource(HashAlgorithm algorithm,
                              std::string_view content) {
  switch (algorithm) {
    case HashAlgorithm::kSha256:
      return FormatHashSource("sha256-", crypto::SHA256HashString(content));
    case HashAlgorithm::kSha384:
      return FormatHashSource("sha384-", crypto::SHA384HashString(content));
    case HashAlgorithm::kSha512:
      return FormatHashSource("sha512-", crypto::SHA512HashString(content));
  }
  NOTREACHED() << "Unsupported hash algorithm "
               << static_cast<int>(algorithm);
  return std::string();
}

}  // namespace cspbuilder
