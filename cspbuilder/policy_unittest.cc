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


#include "cspbuilder/policy.h"

#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "base/base64url.h"
#include "base/logging.h"
#include "cspbuilder/csp_constants.h"
#include "cspbuilder/nonce.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace cspbuilder {

namespace {

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::Not;

const char kStarterPolicy[] =
    "default-src 'none';base-uri 'self';connect-src 'self';"
    "form-action 'self';img-src 'self';script-src 'self';style-src 'self'";

const char kDoSomethingSha512[] =
    "'sha512-NrS2FABurNzIW2yTKRxF8X+HMhJh29vd9syOLut1MW4Cd1JeGzZqughLzC+LQr0O"
    "8XFhCuR4zyjLgrTQct7jAA=='";

// Returns the nonce embedded in |header| as 'nonce-<value>', or an empty
// string.
std::string ExtractNonce(const std::string& header) {
  const std::string prefix = "'nonce-";
  size_t start = header.find(prefix);
  if (start == std::string::npos)
    return std::string();
  start += prefix.size();
  size_t end = header.find('\'', start);
  if (end == std::string::npos)
    return std::string();
  return header.substr(start, end - start);
}

Policy NoncePolicy() {
  Policy policy;
  policy.SetDirective(kDefaultSrc, Directive::NoneOnly());
  Directive& script = policy.AddDirective(kScriptSrc);
  script.AddKeyword(Directive::Keyword::kNonce);
  script.AddKeyword(Directive::Keyword::kStrictDynamic);
  Directive& style = policy.AddDirective(kStyleSrc, {"fonts.example.com"});
  style.AddKeyword(Directive::Keyword::kNonce);
  return policy;
}

}  // namespace

TEST(PolicyTest, EmptyPolicy) {
  Policy policy;
  EXPECT_FALSE(policy.is_built());
  EXPECT_EQ("", policy.Build());
  EXPECT_TRUE(policy.is_built());
  EXPECT_FALSE(policy.requires_nonce());
}

TEST(PolicyTest, EmptyPolicyWithGlobalFlags) {
  Policy policy;
  policy.set_upgrade_insecure_requests(true);
  EXPECT_EQ("upgrade-insecure-requests", policy.Build());

  policy.set_report_uri("/_csp-report");
  EXPECT_EQ("upgrade-insecure-requests;report-uri /_csp-report",
            policy.Build());

  policy.set_upgrade_insecure_requests(false);
  EXPECT_EQ("report-uri /_csp-report", policy.Build());
}

TEST(PolicyTest, Starter) {
  Policy policy = Policy::Starter();
  EXPECT_EQ(kStarterPolicy, policy.Build());
  EXPECT_EQ(kStarterPolicy, policy.compiled());
  EXPECT_FALSE(policy.requires_nonce());
}

TEST(PolicyTest, DefaultSrcLeadsThenNameOrder) {
  Policy policy;
  policy.AddDirective(kWorkerSrc, {"'self'"});
  policy.AddDirective(kConnectSrc, {"api.example.com"});
  policy.SetDirective(kDefaultSrc, Directive::SelfOnly());
  policy.AddDirective(kImgSrc).set_all(true);

  EXPECT_EQ(
      "default-src 'self';connect-src api.example.com;img-src *;"
      "worker-src 'self'",
      policy.Build());
}

TEST(PolicyTest, BuildIsIdempotent) {
  Policy policy = Policy::Starter();
  policy.AddDirective(kScriptSrc, {"cdn.example.com"})
      .AddHash(HashAlgorithm::kSha384, "doSomething()");
  policy.set_upgrade_insecure_requests(true);
  policy.set_report_uri("/_csp-report");

  const std::string first = policy.Build();
  const std::string second = policy.Build();
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, policy.compiled());
}

TEST(PolicyTest, WellFormed) {
  Policy policy = Policy::Starter();
  policy.AddDirective(kObjectSrc);
  policy.AddDirective(kFrameAncestors, {"'self'"});
  policy.set_upgrade_insecure_requests(true);

  const std::string& compiled = policy.Build();
  EXPECT_THAT(compiled, Not(HasSubstr(";;")));
  EXPECT_THAT(compiled, Not(EndsWith(";")));
  EXPECT_THAT(compiled, HasSubstr("object-src 'none';"));
  EXPECT_THAT(compiled, EndsWith("style-src 'self';upgrade-insecure-requests"));
}

TEST(PolicyTest, EndToEnd) {
  Policy policy;
  Directive& script = policy.AddDirective(
      kScriptSrc, {"cdnjs.cloudflare.com", "cdn.jsdelivr.net"});
  script.AddHash(HashAlgorithm::kSha512, "doSomething()");
  script.AddSources({"www.google-analytics.com", kUnsafeInline, kData});
  policy.set_upgrade_insecure_requests(true);
  policy.set_report_uri("/_csp-report");

  const std::string& compiled = policy.Build();
  EXPECT_THAT(compiled,
              HasSubstr(std::string(
                            "script-src cdnjs.cloudflare.com cdn.jsdelivr.net ") +
                        kDoSomethingSha512 +
                        " www.google-analytics.com 'unsafe-inline' data:"));
  EXPECT_THAT(compiled,
              EndsWith("upgrade-insecure-requests;report-uri /_csp-report"));
  EXPECT_FALSE(policy.requires_nonce());
}

TEST(PolicyTest, SetDirectiveReplaces) {
  Policy policy;
  policy.AddDirective(kImgSrc, {"a.example.com"});
  policy.AddDirective(kImgSrc, {"b.example.com"});
  EXPECT_EQ("img-src b.example.com", policy.Build());
  EXPECT_EQ(1u, policy.directives().size());

  policy.SetDirective(kImgSrc, Directive::NoneOnly());
  EXPECT_EQ("img-src 'none'", policy.Build());
}

TEST(PolicyTest, GetAndRemoveDirective) {
  Policy policy = Policy::Starter();
  const Directive* script = policy.GetDirective(kScriptSrc);
  ASSERT_TRUE(script);
  EXPECT_EQ(Directive::SelfOnly(), *script);
  EXPECT_FALSE(policy.GetDirective(kFontSrc));

  EXPECT_TRUE(policy.RemoveDirective(kScriptSrc));
  EXPECT_FALSE(policy.RemoveDirective(kScriptSrc));
  EXPECT_FALSE(policy.GetDirective(kScriptSrc));
  EXPECT_THAT(policy.Build(), Not(HasSubstr("script-src")));
}

TEST(PolicyTest, StarterDoesNotShareCanonicalDirectives) {
  Policy policy = Policy::Starter();
  policy.AddDirective(kBaseUri);
  Directive script = *policy.GetDirective(kScriptSrc);
  script.AddSource("cdn.example.com");
  policy.SetDirective(kScriptSrc, script);

  EXPECT_EQ("'self'", Directive::SelfOnly().ToString());
  EXPECT_EQ("'none'", Directive::NoneOnly().ToString());
  EXPECT_THAT(policy.Build(), HasSubstr("script-src 'self' cdn.example.com;"));
}

TEST(PolicyTest, ExperimentalDirectiveNames) {
  Policy policy;
  policy.AddDirective("fenced-frame-src", {"https://ads.example.com"});
  policy.AddDirective(kRequireTrustedTypesFor, {kTrustedScript});
  EXPECT_EQ(
      "fenced-frame-src https://ads.example.com;"
      "require-trusted-types-for 'script'",
      policy.Build());
}

TEST(PolicyTest, WithNonceWithoutNonceDirective) {
  Policy policy = Policy::Starter();
  policy.Build();

  std::string nonce = "stale";
  EXPECT_EQ(policy.compiled(), policy.WithNonce(&nonce));
  EXPECT_TRUE(nonce.empty());
}

TEST(PolicyTest, NonceGating) {
  Policy policy = NoncePolicy();
  const std::string compiled = policy.Build();
  EXPECT_TRUE(policy.requires_nonce());
  EXPECT_EQ(
      "default-src 'none';script-src $NONCE 'strict-dynamic';"
      "style-src $NONCE fonts.example.com",
      compiled);

  std::string nonce;
  const std::string header = policy.WithNonce(&nonce);
  ASSERT_FALSE(nonce.empty());
  EXPECT_NE(compiled, header);
  EXPECT_THAT(header, Not(HasSubstr(kDefaultNoncePlaceholder)));
  EXPECT_EQ(
      "default-src 'none';script-src " + FormatNonceSource(nonce) +
          " 'strict-dynamic';style-src " + FormatNonceSource(nonce) +
          " fonts.example.com",
      header);
  // The cached template is untouched.
  EXPECT_EQ(compiled, policy.compiled());
}

TEST(PolicyTest, LiteralPlaceholderRequestsNonce) {
  Policy policy;
  policy.AddDirective(kScriptSrc, {kSelf, kDefaultNoncePlaceholder});
  EXPECT_EQ("script-src 'self' $NONCE", policy.Build());
  EXPECT_TRUE(policy.requires_nonce());

  std::string nonce;
  const std::string header = policy.WithNonce(&nonce);
  ASSERT_FALSE(nonce.empty());
  EXPECT_EQ("script-src 'self' " + FormatNonceSource(nonce), header);
}

TEST(PolicyTest, LiteralCustomPlaceholderRequestsNonce) {
  Policy policy;
  policy.set_nonce_placeholder("{{csp-nonce}}");
  policy.AddDirective(kStyleSrc, {"{{csp-nonce}}"});
  EXPECT_EQ("style-src {{csp-nonce}}", policy.Build());
  EXPECT_TRUE(policy.requires_nonce());

  std::string nonce;
  const std::string header = policy.WithNonce(&nonce);
  EXPECT_EQ("style-src " + FormatNonceSource(nonce), header);
}

TEST(PolicyTest, PlaceholderUnderAllIsNotEmitted) {
  Policy policy;
  Directive& script = policy.AddDirective(kScriptSrc);
  script.AddKeyword(Directive::Keyword::kNonce);
  script.set_all(true);
  EXPECT_EQ("script-src *", policy.Build());
  EXPECT_FALSE(policy.requires_nonce());
}

TEST(PolicyTest, NonceFreshness) {
  Policy policy = NoncePolicy();
  policy.Build();

  std::string first_nonce;
  std::string second_nonce;
  const std::string first = policy.WithNonce(&first_nonce);
  const std::string second = policy.WithNonce(&second_nonce);
  EXPECT_NE(first_nonce, second_nonce);
  EXPECT_NE(first, second);
  EXPECT_EQ(first_nonce, ExtractNonce(first));
  EXPECT_EQ(second_nonce, ExtractNonce(second));

  for (const std::string& nonce : {first_nonce, second_nonce}) {
    std::string decoded;
    ASSERT_TRUE(base::Base64UrlDecode(
        nonce, base::Base64UrlDecodePolicy::IGNORE_PADDING, &decoded));
    EXPECT_GE(decoded.size(), 16u);
  }
}

TEST(PolicyTest, RequiresNonceFollowsRebuild) {
  Policy policy = NoncePolicy();
  policy.Build();
  EXPECT_TRUE(policy.requires_nonce());

  policy.SetDirective(kScriptSrc, Directive::SelfOnly());
  policy.RemoveDirective(kStyleSrc);
  // Not recomputed until the next Build().
  EXPECT_TRUE(policy.requires_nonce());
  policy.Build();
  EXPECT_FALSE(policy.requires_nonce());
}

TEST(PolicyTest, CustomNoncePlaceholder) {
  Policy policy = NoncePolicy();
  policy.set_nonce_placeholder("{{csp-nonce}}");
  EXPECT_THAT(policy.Build(), HasSubstr("script-src {{csp-nonce}} "));

  std::string nonce;
  const std::string header = policy.WithNonce(&nonce);
  EXPECT_THAT(header, Not(HasSubstr("{{csp-nonce}}")));
  EXPECT_THAT(header, HasSubstr(FormatNonceSource(nonce)));

  policy.set_nonce_placeholder(std::string());
  EXPECT_EQ(kDefaultNoncePlaceholder, policy.nonce_placeholder());
}

TEST(PolicyTest, SubstituteNonce) {
  Policy policy;
  std::string nonce;
  const std::string header =
      policy.SubstituteNonce("script-src $NONCE;style-src $NONCE", &nonce);
  const std::string source = FormatNonceSource(nonce);
  EXPECT_EQ("script-src " + source + ";style-src " + source, header);
}

TEST(PolicyTest, MergeBuildAppendsAdditions) {
  Policy policy = Policy::Starter();
  policy.Build();

  DirectiveMap additions;
  additions[kScriptSrc].AddHash(HashAlgorithm::kSha256, "doSomething()");
  additions[kStyleSrc].AddSource("fonts.example.com");

  bool requires_nonce = true;
  const std::string merged = policy.MergeBuild(additions, &requires_nonce);
  EXPECT_FALSE(requires_nonce);
  EXPECT_EQ(
      "default-src 'none';base-uri 'self';connect-src 'self';"
      "form-action 'self';img-src 'self';"
      "script-src 'self' 'sha256-bnQkgwAfjTxnZSlFxZe1ogJadBHLnRuuL54WC+v+tMY=';"
      "style-src 'self' fonts.example.com",
      merged);
}

TEST(PolicyTest, MergeBuildDoesNotMutate) {
  Policy policy = Policy::Starter();
  policy.set_report_uri("/_csp-report");
  policy.Build();
  const std::string compiled_before = policy.compiled();
  const DirectiveMap directives_before = policy.directives();

  DirectiveMap additions;
  additions[kScriptSrc].AddSource("cdn.example.com");
  additions[kScriptSrc].AddKeyword(Directive::Keyword::kNonce);
  bool requires_nonce = false;
  const std::string merged = policy.MergeBuild(additions, &requires_nonce);

  EXPECT_TRUE(requires_nonce);
  EXPECT_THAT(merged, HasSubstr("script-src 'self' $NONCE cdn.example.com;"));
  EXPECT_EQ(compiled_before, policy.compiled());
  EXPECT_TRUE(directives_before == policy.directives());
  EXPECT_FALSE(policy.requires_nonce());
}

TEST(PolicyTest, MergeBuildIgnoresUnknownNames) {
  Policy policy = Policy::Starter();
  policy.Build();

  DirectiveMap additions;
  additions[kFontSrc].AddSource("fonts.example.com");
  additions[kWorkerSrc].AddKeyword(Directive::Keyword::kNonce);

  bool requires_nonce = true;
  EXPECT_EQ(kStarterPolicy, policy.MergeBuild(additions, &requires_nonce));
  EXPECT_FALSE(requires_nonce);
}

TEST(PolicyTest, MergeBuildSkipsEmptyAdditions) {
  Policy policy = Policy::Starter();
  policy.Build();

  DirectiveMap additions;
  additions[kScriptSrc] = Directive();
  additions[kStyleSrc].set_none(true);

  bool requires_nonce = true;
  EXPECT_EQ(kStarterPolicy, policy.MergeBuild(additions, &requires_nonce));
  EXPECT_FALSE(requires_nonce);
}

TEST(PolicyTest, MergeBuildLiteralPlaceholderAddition) {
  Policy policy = Policy::Starter();
  policy.Build();

  DirectiveMap additions;
  additions[kScriptSrc].AddSource(kDefaultNoncePlaceholder);

  bool requires_nonce = false;
  EXPECT_THAT(policy.MergeBuild(additions, &requires_nonce),
              HasSubstr("script-src 'self' $NONCE;"));
  EXPECT_TRUE(requires_nonce);
}

TEST(PolicyTest, MergeBuildWithoutAdditions) {
  Policy policy = NoncePolicy();
  policy.Build();
  bool requires_nonce = false;
  EXPECT_EQ(policy.compiled(),
            policy.MergeBuild(DirectiveMap(), &requires_nonce));
  EXPECT_TRUE(requires_nonce);
  EXPECT_EQ(policy.compiled(), policy.MergeBuild(DirectiveMap()));
}

TEST(PolicyTest, ToMap) {
  Policy policy = NoncePolicy();
  policy.AddDirective(kImgSrc).set_all(true);

  const std::map<std::string, std::string> expected = {
      {kDefaultSrc, "'none'"},
      {kImgSrc, "*"},
      {kScriptSrc, "'strict-dynamic'"},
      {kStyleSrc, "fonts.example.com"},
  };
  EXPECT_EQ(expected, policy.ToMap());
}

TEST(PolicyTest, ConcurrentWithNonce) {
  Policy policy = NoncePolicy();
  policy.Build();
  const Policy& shared = policy;

  constexpr int kThreads = 8;
  constexpr int kIterations = 50;
  std::vector<std::vector<std::string>> nonces(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&shared, &nonces, i] {
      for (int j = 0; j < kIterations; ++j) {
        std::string nonce;
        shared.WithNonce(&nonce);
        nonces[i].push_back(nonce);
      }
    });
  }
  for (std::thread& thread : threads)
    thread.join();

  std::set<std::string> unique;
  for (const auto& per_thread : nonces)
    unique.insert(per_thread.begin(), per_thread.end());
  EXPECT_EQ(static_cast<size_t>(kThreads * kIterations), unique.size());
}

#if DCHECK_IS_ON()
TEST(PolicyDeathTest, WithNonceBeforeBuild) {
  Policy policy = NoncePolicy();
  std::string nonce;
  EXPECT_DEATH(policy.WithNonce(&nonce), "WithNonce\\(\\) called before Build");
}

TEST(PolicyDeathTest, EmptyDirectiveName) {
  Policy policy;
  EXPECT_DEATH(policy.SetDirective("", Directive()), "Check failed");
}
#endif

}  // namespace cspbuilder
