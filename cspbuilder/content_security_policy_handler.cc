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

#include "cspbuilder/content_security_policy_handler.h"

#include <utility>

#include "base/logging.h"
#include "cspbuilder/csp_constants.h"

namespace cspbuilder {

ContentSecurityPolicyHandler::ContentSecurityPolicyHandler(Policy policy,
                                                           bool report_only)
    : policy_(std::move(policy)), report_only_(report_only) {
  policy_.Build();
  DVLOG(1) << header_name() << " template: " << policy_.compiled();
}

ContentSecurityPolicyHandler::~ContentSecurityPolicyHandler() = default;

const char* ContentSecurityPolicyHandler::header_name() const {
  return report_only_ ? kContentSecurityPolicyReportOnlyHeader
                      : kContentSecurityPolicyHeader;
}

ContentSecurityPolicyHandler::HeaderValue
ContentSecurityPolicyHandler::ComputeHeaderValue(
    const DirectiveMap* additions) const {
  HeaderValue header;
  if (additions && !additions->empty()) {
    bool requires_nonce = false;
    std::string merged = policy_.MergeBuild(*additions, &requires_nonce);
    if (requires_nonce)
      header.value = policy_.SubstituteNonce(merged, &header.nonce);
    else
      header.value = std::move(merged);
    return header;
  }

  header.value = policy_.WithNonce(&header.nonce);
  return header;
}

}  // namespace cspbuilder
