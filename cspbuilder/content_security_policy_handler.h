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

#ifndef CSPBUILDER_CONTENT_SECURITY_POLICY_HANDLER_H_
#define CSPBUILDER_CONTENT_SECURITY_POLICY_HANDLER_H_

#include <string>

#include "cspbuilder/cspbuilder_export.h"
#include "cspbuilder/policy.h"

namespace cspbuilder {

// Computes the Content-Security-Policy header for each response of an HTTP
// service, independent of the server framework. The handler owns a built
// copy of the policy, so one instance can be shared by every request thread.
//
//   ContentSecurityPolicyHandler csp(std::move(policy), /*report_only=*/false);
//   ...
//   ContentSecurityPolicyHandler::HeaderValue header =
//       csp.ComputeHeaderValue(&request_additions);
//   response.SetHeader(csp.header_name(), header.value);
//   template_context.Set("csp_nonce", header.nonce);
//
// The header has to be set before the response body starts streaming.
class CSPBUILDER_EXPORT ContentSecurityPolicyHandler {
 public:
  struct HeaderValue {
    // Value of the header named by header_name().
    std::string value;
    // Nonce embedded in |value|, for nonce="..." attributes in the body.
    // Empty when the policy needs no nonce.
    std::string nonce;
  };

  // Builds |policy|. With |report_only| set the header is emitted as
  // Content-Security-Policy-Report-Only.
  ContentSecurityPolicyHandler(Policy policy, bool report_only);

  ContentSecurityPolicyHandler(const ContentSecurityPolicyHandler&) = delete;
  ContentSecurityPolicyHandler& operator=(
      const ContentSecurityPolicyHandler&) = delete;

  ~ContentSecurityPolicyHandler();

  const char* header_name() const;
  bool report_only() const { return report_only_; }
  const Policy& policy() const { return policy_; }

  // Returns the header value for one response. Request-scoped |additions|
  // (may be null or empty) are merged into the matching static directives;
  // a nonce is generated whenever the resulting policy asks for one.
  HeaderValue ComputeHeaderValue(const DirectiveMap* additions = nullptr) const;

 private:
  Policy policy_;
  const bool report_only_;
};

}  // namespace cspbuilder

#endif  // CSPBUILDER_CONTENT_SECURITY_POLICY_HANDLER_H_
