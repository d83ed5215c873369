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

#ifndef CSPBUILDER_POLICY_H_
#define CSPBUILDER_POLICY_H_

#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "cspbuilder/cspbuilder_export.h"
#include "cspbuilder/directive.h"

namespace cspbuilder {

// Directives keyed by directive name.
using DirectiveMap = std::map<std::string, Directive, std::less<>>;

// Policy is the declarative form of a Content-Security-Policy header: a set
// of named directives plus the policy-wide upgrade-insecure-requests and
// report-uri settings.
//
// Typical use is to configure the policy once, call Build() during startup,
// and then serve every response from the cached template:
//
//   cspbuilder::Policy policy = cspbuilder::Policy::Starter();
//   policy.AddDirective(cspbuilder::kScriptSrc, {"cdn.example.com"})
//       .AddKeyword(cspbuilder::Directive::Keyword::kNonce);
//   policy.Build();
//   ...
//   std::string nonce;
//   std::string header = policy.WithNonce(&nonce);
//
// Threading: Build() and the setters mutate the policy and must not run
// concurrently with anything else on it. Once Build() has returned, the const
// methods (WithNonce(), MergeBuild(), ToMap() and the accessors) may be
// called from any number of threads at once. Rebuilding at runtime requires
// the caller to exclude those readers for the duration.
class CSPBUILDER_EXPORT Policy {
 public:
  Policy();
  Policy(const Policy& other);
  Policy(Policy&& other);
  Policy& operator=(const Policy& other);
  Policy& operator=(Policy&& other);
  ~Policy();

  // Returns a policy seeded with restrictive defaults:
  //   default-src 'none'; base-uri 'self'; connect-src 'self';
  //   form-action 'self'; img-src 'self'; script-src 'self';
  //   style-src 'self'
  static Policy Starter();

  // Sets the directive called |name|, replacing any directive already stored
  // under that name. Names are not checked against a vocabulary.
  void SetDirective(std::string_view name, Directive directive);

  // Replaces the directive called |name| with a fresh one holding |sources|
  // and returns it for further configuration. The reference stays valid until
  // the directive is replaced or removed.
  Directive& AddDirective(std::string_view name,
                          std::initializer_list<std::string_view> sources = {});

  // Returns false if no directive was stored under |name|.
  bool RemoveDirective(std::string_view name);

  // Returns the directive called |name|, or null.
  const Directive* GetDirective(std::string_view name) const;

  const DirectiveMap& directives() const { return directives_; }

  void set_upgrade_insecure_requests(bool upgrade) {
    upgrade_insecure_requests_ = upgrade;
  }
  bool upgrade_insecure_requests() const { return upgrade_insecure_requests_; }

  void set_report_uri(std::string report_uri) {
    report_uri_ = std::move(report_uri);
  }
  const std::string& report_uri() const { return report_uri_; }

  // Changes the token that marks nonce positions in the compiled template.
  // An empty |placeholder| restores kDefaultNoncePlaceholder. Takes effect at
  // the next Build().
  void set_nonce_placeholder(std::string placeholder);
  const std::string& nonce_placeholder() const { return nonce_placeholder_; }

  // Compiles the policy into a header value, caches it as compiled() and
  // recomputes requires_nonce(). Directives are written as
  // "<name> <sources>;", default-src first and the rest in ascending name
  // order, followed by "upgrade-insecure-requests;" and "report-uri <uri>"
  // when set. A trailing ';' is dropped. Calling Build() again without
  // changes in between yields the same string.
  const std::string& Build();

  // Result of the last Build(). Contains the nonce placeholder wherever a
  // directive asks for a nonce.
  const std::string& compiled() const { return compiled_; }

  // True if the last Build() wrote a nonce placeholder, either for
  // Keyword::kNonce or for a literal source equal to nonce_placeholder().
  bool requires_nonce() const { return requires_nonce_; }

  bool is_built() const { return built_; }

  // Returns the header value for one response. When requires_nonce() is set,
  // a fresh nonce is generated, stored in |nonce| and substituted for every
  // placeholder in compiled(). Otherwise compiled() is returned unchanged and
  // |nonce| is cleared. Build() must have run first.
  std::string WithNonce(std::string* nonce) const;

  // Generates a fresh nonce into |nonce| and returns |policy_template| with
  // every nonce placeholder replaced by the matching nonce-source. Used on
  // the output of MergeBuild() when it reports a nonce requirement.
  std::string SubstituteNonce(std::string_view policy_template,
                              std::string* nonce) const;

  // Compiles the policy as Build() does, appending the sources of
  // |additions| to the directive of the same name. Names present only in
  // |additions|, and additions without sources, are ignored. Neither the directives nor compiled() change.
  // If |requires_nonce| is non-null it receives whether any static or
  // additional directive asks for a nonce.
  std::string MergeBuild(const DirectiveMap& additions,
                         bool* requires_nonce = nullptr) const;

  // Returns every directive rendered on its own, keyed by name.
  // Keyword::kNonce is left out, so the values suit consumers that can only
  // emit a static header. Literal sources are kept verbatim.
  std::map<std::string, std::string> ToMap() const;

 private:
  std::string Compile(const DirectiveMap* additions,
                      bool* requires_nonce) const;
  // True if |directive| renders the nonce placeholder.
  bool EmitsNonce(const Directive& directive) const;
  void AppendDirective(const std::string& name,
                       const Directive& directive,
                       const DirectiveMap* additions,
                       std::string* output,
                       bool* requires_nonce) const;

  DirectiveMap directives_;
  bool upgrade_insecure_requests_ = false;
  std::string report_uri_;
  std::string nonce_placeholder_;

  // Cached by Build().
  std::string compiled_;
  bool requires_nonce_ = false;
  bool built_ = false;
};

}  // namespace cspbuilder

#endif  // CSPBUILDER_POLICY_H_
