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

#include "base/base64url.h"
#include "crypto/random.h"

namespace cspbuilder {

std::string GenerateNonce() {
  std::string nonce;
  base::Base64UrlEncode(crypto::RandBytesAsString(kNonceLengthInBytes),
                        base::Base64UrlEncodePolicy::OMIT_PADDING, &nonce);
  return nonce;
}

std::string FormatNonceSource(std::string_view nonce) {
  std::string source("'nonce-");
  source.append(nonce);
  source.push_back('\'');
  return source;
}

}  // namespace cspbuilder
