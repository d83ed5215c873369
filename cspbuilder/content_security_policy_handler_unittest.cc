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

#include <string>
#include <utility>

#include "cspbuilder/csp_constants.h"
#include "cspbuilder/nonce.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace cspbuilder {

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

Policy ScriptNoncePolicy() {
  Policy policy = Policy::Starter();
  Directive& script = policy.AddDirective(kScriptSrc);
  script.AddKeyword(Directive::Keyword::kNonce);
  script.AddKeyword(Directive::Keyword::kStrictDynamic);
  return policy;
}

}  // namespace

TEST(ContentSecurityPolicyHandlerTest, HeaderName) {
  ContentSecurityPolicyHandler enforcing(Policy::Starter(), false);
  EXPECT_STREQ("Content-Security-Policy", enforcing.header_name());
  EXPECT_FALSE(enforcing.report_only());

  ContentSecurityPolicyHandler report_only(Policy::Starter(), true);
  EXPECT_STREQ("Content-Security-Policy-Report-Only",
               report_only.header_name());
  EXPECT_TRUE(report_only.report_only());
}

TEST(ContentSecurityPolicyHandlerTest, BuildsPolicyOnConstruction) {
  ContentSecurityPolicyHandler handler(Policy::Starter(), false);
  EXPECT_TRUE(handler.policy().is_built());
  EXPECT_FALSE(handler.policy().compiled().empty());
}

TEST(ContentSecurityPolicyHandlerTest, StaticPolicy) {
  ContentSecurityPolicyHandler handler(Policy::Starter(), false);
  ContentSecurityPolicyHandler::HeaderValue header =
      handler.ComputeHeaderValue();
  EXPECT_EQ(handler.policy().compiled(), header.value);
  EXPECT_TRUE(header.nonce.empty());

  DirectiveMap empty;
  header = handler.ComputeHeaderValue(&empty);
  EXPECT_EQ(handler.policy().compiled(), header.value);
  EXPECT_TRUE(header.nonce.empty());
}

TEST(ContentSecurityPolicyHandlerTest, NonceEveryResponse) {
  ContentSecurityPolicyHandler handler(ScriptNoncePolicy(), false);

  ContentSecurityPolicyHandler::HeaderValue first =
      handler.ComputeHeaderValue();
  ContentSecurityPolicyHandler::HeaderValue second =
      handler.ComputeHeaderValue();
  ASSERT_FALSE(first.nonce.empty());
  ASSERT_FALSE(second.nonce.empty());
  EXPECT_NE(first.nonce, second.nonce);
  EXPECT_THAT(first.value,
              HasSubstr("script-src " + FormatNonceSource(first.nonce) +
                        " 'strict-dynamic';"));
  EXPECT_THAT(first.value, Not(HasSubstr(kDefaultNoncePlaceholder)));
}

TEST(ContentSecurityPolicyHandlerTest, MergesRequestAdditions) {
  ContentSecurityPolicyHandler handler(Policy::Starter(), false);

  DirectiveMap additions;
  additions[kScriptSrc].AddHash(HashAlgorithm::kSha256, "doSomething()");
  ContentSecurityPolicyHandler::HeaderValue header =
      handler.ComputeHeaderValue(&additions);

  EXPECT_THAT(header.value,
              HasSubstr("script-src 'self' "
                        "'sha256-bnQkgwAfjTxnZSlFxZe1ogJadBHLnRuuL54WC+v+tMY=';"));
  EXPECT_TRUE(header.nonce.empty());

  // The static template is not affected by the request.
  EXPECT_EQ(handler.policy().compiled(), handler.ComputeHeaderValue().value);
}

TEST(ContentSecurityPolicyHandlerTest, MergesAdditionsIntoNoncePolicy) {
  ContentSecurityPolicyHandler handler(ScriptNoncePolicy(), true);

  DirectiveMap additions;
  additions[kStyleSrc].AddSource("fonts.example.com");
  ContentSecurityPolicyHandler::HeaderValue header =
      handler.ComputeHeaderValue(&additions);

  ASSERT_FALSE(header.nonce.empty());
  EXPECT_THAT(header.value,
              HasSubstr("script-src " + FormatNonceSource(header.nonce)));
  EXPECT_THAT(header.value, HasSubstr("style-src 'self' fonts.example.com"));
  EXPECT_THAT(header.value, Not(HasSubstr(kDefaultNoncePlaceholder)));
}

TEST(ContentSecurityPolicyHandlerTest, LiteralPlaceholderGetsNonce) {
  Policy policy;
  policy.AddDirective(kScriptSrc, {kSelf, kDefaultNoncePlaceholder});
  ContentSecurityPolicyHandler handler(std::move(policy), false);

  ContentSecurityPolicyHandler::HeaderValue header =
      handler.ComputeHeaderValue();
  ASSERT_FALSE(header.nonce.empty());
  EXPECT_EQ("script-src 'self' " + FormatNonceSource(header.nonce),
            header.value);
}

TEST(ContentSecurityPolicyHandlerTest, EmptyAdditionLeavesPolicyUnchanged) {
  ContentSecurityPolicyHandler handler(Policy::Starter(), false);

  DirectiveMap additions;
  additions[kScriptSrc] = Directive();
  ContentSecurityPolicyHandler::HeaderValue header =
      handler.ComputeHeaderValue(&additions);
  EXPECT_EQ(handler.policy().compiled(), header.value);
  EXPECT_THAT(header.value, Not(HasSubstr("'self' 'none'")));
  EXPECT_TRUE(header.nonce.empty());
}

TEST(ContentSecurityPolicyHandlerTest, NonceRequestedByAdditionsOnly) {
  ContentSecurityPolicyHandler handler(Policy::Starter(), false);

  DirectiveMap additions;
  additions[kStyleSrc].AddKeyword(Directive::Keyword::kNonce);
  ContentSecurityPolicyHandler::HeaderValue header =
      handler.ComputeHeaderValue(&additions);

  ASSERT_FALSE(header.nonce.empty());
  EXPECT_THAT(header.value,
              HasSubstr("style-src 'self' " + FormatNonceSource(header.nonce)));
  EXPECT_FALSE(handler.policy().requires_nonce());
}

}  // namespace cspbuilder
