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


#include "cspbuilder/directive.h"

#include <string>
#include <utility>

#include "cspbuilder/csp_constants.h"
#include "gtest/gtest.h"

namespace cspbuilder {

TEST(DirectiveTest, EmptyRendersNone) {
  Directive directive;
  EXPECT_EQ("'none'", directive.ToString());
  EXPECT_FALSE(directive.requires_nonce());
}

TEST(DirectiveTest, AllShortCircuits) {
  Directive directive({"cdn.example.com"});
  directive.AddKeyword(Directive::Keyword::kSelf);
  directive.AddKeyword(Directive::Keyword::kNonce);
  directive.AddScheme(Directive::Scheme::kData);
  directive.set_none(true);
  directive.set_all(true);
  EXPECT_EQ("*", directive.ToString());
  EXPECT_EQ("*", directive.Render(std::string_view()));

  directive.set_all(false);
  EXPECT_EQ("$NONCE 'self' data: cdn.example.com", directive.ToString());
}

TEST(DirectiveTest, NoneFlagIgnoredWithOtherContent) {
  Directive directive;
  directive.set_none(true);
  EXPECT_EQ("'none'", directive.ToString());

  directive.AddSource("https://example.com");
  EXPECT_EQ("https://example.com", directive.ToString());

  Directive keyword_only;
  keyword_only.set_none(true);
  keyword_only.AddKeyword(Directive::Keyword::kSelf);
  EXPECT_EQ("'self'", keyword_only.ToString());
}

TEST(DirectiveTest, KeywordsRenderInFixedOrder) {
  Directive directive;
  directive.AddKeyword(Directive::Keyword::kUnsafeHashes);
  directive.AddKeyword(Directive::Keyword::kUnsafeAllowRedirects);
  directive.AddKeyword(Directive::Keyword::kUnsafeEval);
  directive.AddKeyword(Directive::Keyword::kUnsafeInline);
  directive.AddKeyword(Directive::Keyword::kSelf);
  directive.AddKeyword(Directive::Keyword::kStrictDynamic);
  directive.AddKeyword(Directive::Keyword::kNonce);
  directive.AddScheme(Directive::Scheme::kFilesystem);
  directive.AddScheme(Directive::Scheme::kMediastream);
  directive.AddScheme(Directive::Scheme::kData);
  directive.AddScheme(Directive::Scheme::kBlob);

  EXPECT_EQ(
      "$NONCE 'strict-dynamic' 'self' 'unsafe-inline' 'unsafe-eval' "
      "'unsafe-allow-redirects' 'unsafe-hashes' blob: data: mediastream: "
      "filesystem:",
      directive.ToString());
}

TEST(DirectiveTest, SourcesKeepInsertionOrderAfterFlags) {
  Directive directive({"z.example.com", "a.example.com"});
  directive.AddSource("m.example.com");
  directive.AddScheme(Directive::Scheme::kBlob);
  directive.AddKeyword(Directive::Keyword::kSelf);
  EXPECT_EQ("'self' blob: z.example.com a.example.com m.example.com",
            directive.ToString());
  ASSERT_EQ(3u, directive.sources().size());
  EXPECT_EQ("z.example.com", directive.sources()[0]);
}

TEST(DirectiveTest, DuplicateKeywordRendersOnce) {
  Directive directive;
  directive.AddKeyword(Directive::Keyword::kSelf);
  directive.AddKeyword(Directive::Keyword::kSelf);
  EXPECT_EQ("'self'", directive.ToString());
}

TEST(DirectiveTest, RemoveKeywordAndScheme) {
  Directive directive;
  directive.AddKeyword(Directive::Keyword::kUnsafeEval);
  directive.AddScheme(Directive::Scheme::kData);
  EXPECT_TRUE(directive.HasKeyword(Directive::Keyword::kUnsafeEval));
  EXPECT_TRUE(directive.HasScheme(Directive::Scheme::kData));

  directive.RemoveKeyword(Directive::Keyword::kUnsafeEval);
  directive.RemoveScheme(Directive::Scheme::kData);
  EXPECT_FALSE(directive.HasKeyword(Directive::Keyword::kUnsafeEval));
  EXPECT_FALSE(directive.HasScheme(Directive::Scheme::kData));
  EXPECT_EQ("'none'", directive.ToString());
}

TEST(DirectiveTest, NoncePlaceholder) {
  Directive directive;
  directive.AddKeyword(Directive::Keyword::kNonce);
  directive.AddKeyword(Directive::Keyword::kStrictDynamic);
  EXPECT_TRUE(directive.requires_nonce());

  EXPECT_EQ("{{nonce}} 'strict-dynamic'", directive.Render("{{nonce}}"));
  // Without a placeholder the nonce is left out.
  EXPECT_EQ("'strict-dynamic'", directive.Render(std::string_view()));
}

TEST(DirectiveTest, NonceOnlyWithoutPlaceholderRendersNone) {
  Directive directive;
  directive.AddKeyword(Directive::Keyword::kNonce);
  EXPECT_EQ("'none'", directive.Render(std::string_view()));
}

TEST(DirectiveTest, IsEmpty) {
  Directive directive;
  EXPECT_TRUE(directive.IsEmpty(kDefaultNoncePlaceholder));
  directive.set_none(true);
  EXPECT_TRUE(directive.IsEmpty(kDefaultNoncePlaceholder));

  // A nonce only counts when there is a placeholder to render it with.
  directive.AddKeyword(Directive::Keyword::kNonce);
  EXPECT_FALSE(directive.IsEmpty(kDefaultNoncePlaceholder));
  EXPECT_TRUE(directive.IsEmpty(std::string_view()));

  Directive all;
  all.set_all(true);
  EXPECT_FALSE(all.IsEmpty(std::string_view()));

  Directive scheme;
  scheme.AddScheme(Directive::Scheme::kBlob);
  EXPECT_FALSE(scheme.IsEmpty(std::string_view()));

  Directive host({"cdn.example.com"});
  EXPECT_FALSE(host.IsEmpty(std::string_view()));
  EXPECT_FALSE(Directive::SelfOnly().IsEmpty(std::string_view()));
}

TEST(DirectiveTest, HasSource) {
  Directive directive({"cdn.example.com", kDefaultNoncePlaceholder});
  EXPECT_TRUE(directive.HasSource("cdn.example.com"));
  EXPECT_TRUE(directive.HasSource(kDefaultNoncePlaceholder));
  EXPECT_FALSE(directive.HasSource("cdn.example"));
  // Flags are not literal sources.
  EXPECT_FALSE(Directive::SelfOnly().HasSource(kSelf));
}

TEST(DirectiveTest, AddHash) {
  Directive directive({"cdn.example.com"});
  directive.AddHash(HashAlgorithm::kSha256, "doSomething()");
  EXPECT_EQ(
      "cdn.example.com "
      "'sha256-bnQkgwAfjTxnZSlFxZe1ogJadBHLnRuuL54WC+v+tMY='",
      directive.ToString());
}

TEST(DirectiveTest, AppendTo) {
  std::string output = "script-src ";
  Directive directive;
  directive.AddKeyword(Directive::Keyword::kSelf);
  directive.AppendTo(kDefaultNoncePlaceholder, &output);
  EXPECT_EQ("script-src 'self'", output);
}

TEST(DirectiveTest, CanonicalDirectives) {
  EXPECT_EQ("'self'", Directive::SelfOnly().ToString());
  EXPECT_EQ("'none'", Directive::NoneOnly().ToString());
  EXPECT_TRUE(Directive::NoneOnly().none());
  EXPECT_EQ(&Directive::SelfOnly(), &Directive::SelfOnly());
  EXPECT_EQ(&Directive::NoneOnly(), &Directive::NoneOnly());
}

TEST(DirectiveTest, CopyOfCanonicalDirectiveIsIndependent) {
  Directive self = Directive::SelfOnly();
  self.AddSource("https://cdn.example.com");
  self.AddKeyword(Directive::Keyword::kUnsafeInline);

  EXPECT_EQ("'self' 'unsafe-inline' https://cdn.example.com",
            self.ToString());
  EXPECT_EQ("'self'", Directive::SelfOnly().ToString());
  EXPECT_TRUE(Directive::SelfOnly().sources().empty());

  Directive none = Directive::NoneOnly();
  none.AddScheme(Directive::Scheme::kBlob);
  EXPECT_EQ("blob:", none.ToString());
  EXPECT_EQ("'none'", Directive::NoneOnly().ToString());
}

TEST(DirectiveTest, Equality) {
  Directive a({"a.example.com"});
  Directive b({"a.example.com"});
  EXPECT_EQ(a, b);

  b.AddKeyword(Directive::Keyword::kSelf);
  EXPECT_NE(a, b);

  Directive moved(std::move(b));
  EXPECT_TRUE(moved.HasKeyword(Directive::Keyword::kSelf));
  EXPECT_NE(a, moved);
}

TEST(DirectiveTest, LiteralKeywordSources) {
  Directive directive({kSelf, kUnsafeInline, kData, kReportSample});
  EXPECT_EQ("'self' 'unsafe-inline' data: 'report-sample'",
            directive.ToString());
  // Literal sources do not set flags.
  EXPECT_FALSE(directive.HasKeyword(Directive::Keyword::kSelf));
}

}  // namespace cspbuilder
