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

#include <utility>

#include "base/logging.h"
#include "base/strings/string_util.h"
#include "cspbuilder/csp_constants.h"
#include "cspbuilder/nonce.h"

namespace cspbuilder {

namespace {

const char* const kWellKnownDirectives[] = {
    kDefaultSrc, kConnectSrc, kFontSrc, kFrameSrc, kImgSrc, kMediaSrc,
    kObjectSrc, kSandbox, kScriptSrc, kStyleSrc, kBaseUri, kChildSrc,
    kFrameAncestors, kPluginTypes, kFormAction, kTrustedTypes,
    kRequireTrustedTypesFor, kStyleSrcAttr, kStyleSrcElem, kScriptSrcAttr,
    kScriptSrcElem, kWorkerSrc, kNavigateTo, kPrefetchSrc, kManifestSrc,
    kReportTo,
};

bool IsWellKnownDirective(std::string_view name) {
  for (const char* known : kWellKnownDirectives) {
    if (name == known)
      return true;
  }
  return false;
}

}  // namespace

Policy::Policy() : nonce_placeholder_(kDefaultNoncePlaceholder) {}

Policy::Policy(const Policy& other) = default;
Policy::Policy(Policy&& other) = default;
Policy& Policy::operator=(const Policy& other) = default;
Policy& Policy::operator=(Policy&& other) = default;
Policy::~Policy() = default;

// static
Policy Policy::Starter() {
  Policy policy;
  policy.SetDirective(kDefaultSrc, Directive::NoneOnly());
  policy.SetDirective(kBaseUri, Directive::SelfOnly());
  policy.SetDirective(kScriptSrc, Directive::SelfOnly());
  policy.SetDirective(kConnectSrc, Directive::SelfOnly());
  policy.SetDirective(kImgSrc, Directive::SelfOnly());
  policy.SetDirective(kStyleSrc, Directive::SelfOnly());
  policy.SetDirective(kFormAction, Directive::SelfOnly());
  return policy;
}

void Policy::SetDirective(std::string_view name, Directive directive) {
  DCHECK(!name.empty());
  DVLOG_IF(1, !IsWellKnownDirective(name)) << "Unrecognized directive " << name;
  auto it = directives_.find(name);
  if (it != directives_.end()) {
    it->second = std::move(directive);
    return;
  }
  directives_.emplace(std::string(name), std::move(directive));
}

Directive& Policy::AddDirective(
    std::string_view name,
    std::initializer_list<std::string_view> sources) {
  SetDirective(name, Directive(sources));
  return directives_.find(name)->second;
}

bool Policy::RemoveDirective(std::string_view name) {
  auto it = directives_.find(name);
  if (it == directives_.end())
    return false;
  directives_.erase(it);
  return true;
}

const Directive* Policy::GetDirective(std::string_view name) const {
  auto it = directives_.find(name);
  return it == directives_.end() ? nullptr : &it->second;
}

void Policy::set_nonce_placeholder(std::string placeholder) {
  if (placeholder.empty())
    placeholder = kDefaultNoncePlaceholder;
  nonce_placeholder_ = std::move(placeholder);
}

const std::string& Policy::Build() {
  bool requires_nonce = false;
  compiled_ = Compile(nullptr, &requires_nonce);
  requires_nonce_ = requires_nonce;
  built_ = true;

  VLOG(1) << "Compiled " << kContentSecurityPolicyHeader << ": " << compiled_
          << (requires_nonce_ ? " (nonce required)" : "");
  return compiled_;
}

std::string Policy::WithNonce(std::string* nonce) const {
  DCHECK(built_) << "WithNonce() called before Build()";
  if (!requires_nonce_) {
    nonce->clear();
    return compiled_;
  }
  return SubstituteNonce(compiled_, nonce);
}

std::string Policy::SubstituteNonce(std::string_view policy_template,
                                    std::string* nonce) const {
  *nonce = GenerateNonce();
  std::string result(policy_template);
  base::ReplaceSubstringsAfterOffset(&result, 0, nonce_placeholder_,
                                     FormatNonceSource(*nonce));
  return result;
}

std::string Policy::MergeBuild(const DirectiveMap& additions,
                               bool* requires_nonce) const {
  bool merged_requires_nonce = false;
  std::string merged = Compile(&additions, &merged_requires_nonce);
  if (requires_nonce)
    *requires_nonce = merged_requires_nonce;
  return merged;
}

std::map<std::string, std::string> Policy::ToMap() const {
  std::map<std::string, std::string> rendered;
  for (const auto& entry : directives_)
    rendered.emplace(entry.first, entry.second.Render(std::string_view()));
  return rendered;
}

std::string Policy::Compile(const DirectiveMap* additions,
                            bool* requires_nonce) const {
  std::string output;

  // default-src leads; the remaining directives follow in map order.
  auto default_src = directives_.find(kDefaultSrc);
  if (default_src != directives_.end()) {
    AppendDirective(default_src->first, default_src->second, additions,
                    &output, requires_nonce);
  }
  for (const auto& entry : directives_) {
    if (entry.first == kDefaultSrc)
      continue;
    AppendDirective(entry.first, entry.second, additions, &output,
                    requires_nonce);
  }

  if (upgrade_insecure_requests_) {
    output.append(kUpgradeInsecureRequests);
    output.push_back(';');
  }

  if (!report_uri_.empty()) {
    output.append(kReportUri);
    output.push_back(' ');
    output.append(report_uri_);
  }

  if (base::EndsWith(output, ";"))
    output.pop_back();
  return output;
}

bool Policy::EmitsNonce(const Directive& directive) const {
  if (directive.all())
    return false;
  return directive.requires_nonce() || directive.HasSource(nonce_placeholder_);
}

void Policy::AppendDirective(const std::string& name,
                             const Directive& directive,
                             const DirectiveMap* additions,
                             std::string* output,
                             bool* requires_nonce) const {
  output->append(name);
  output->push_back(' ');
  directive.AppendTo(nonce_placeholder_, output);
  *requires_nonce = *requires_nonce || EmitsNonce(directive);

  if (additions) {
    auto addition = additions->find(name);
    // An addition without sources contributes nothing, not 'none'.
    if (addition != additions->end() &&
        !addition->second.IsEmpty(nonce_placeholder_)) {
      output->push_back(' ');
      addition->second.AppendTo(nonce_placeholder_, output);
      *requires_nonce = *requires_nonce || EmitsNonce(addition->second);
    }
  }

  output->push_back(';');
}

}  // namespace cspbuilder
