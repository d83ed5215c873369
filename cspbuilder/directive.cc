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

#include <algorithm>
#include <iterator>
#include <utility>

#include "base/logging.h"
#include "base/strings/string_util.h"
#include "cspbuilder/csp_constants.h"

namespace cspbuilder {

namespace {

// Indexed by Directive::Keyword. kNonce has no fixed token.
const char* const kKeywordTokens[] = {
    nullptr,      kStrictDynamic,        kSelf,          kUnsafeInline,
    kUnsafeEval,  kUnsafeAllowRedirects, kUnsafeHashes,
};

// Indexed by Directive::Scheme.
const char* const kSchemeTokens[] = {
    kBlob,
    kData,
    kMediastream,
    kFilesystem,
};

static_assert(std::size(kKeywordTokens) ==
                  static_cast<size_t>(Directive::Keyword::kMaxValue) + 1,
              "kKeywordTokens must cover every Directive::Keyword");
static_assert(std::size(kSchemeTokens) ==
                  static_cast<size_t>(Directive::Scheme::kMaxValue) + 1,
              "kSchemeTokens must cover every Directive::Scheme");

size_t ToIndex(Directive::Keyword keyword) {
  return static_cast<size_t>(keyword);
}

size_t ToIndex(Directive::Scheme scheme) {
  return static_cast<size_t>(scheme);
}

}  // namespace

Directive::Directive() = default;

Directive::Directive(std::initializer_list<std::string_view> sources) {
  AddSources(sources);
}

Directive::Directive(const Directive& other) = default;
Directive::Directive(Directive&& other) noexcept = default;
Directive& Directive::operator=(const Directive& other) = default;
Directive& Directive::operator=(Directive&& other) noexcept = default;
Directive::~Directive() = default;

// static
const Directive& Directive::SelfOnly() {
  static const Directive self_only = [] {
    Directive directive;
    directive.AddKeyword(Keyword::kSelf);
    return directive;
  }();
  return self_only;
}

const Directive& Directive::NoneOnly() {
  static const Directive none_only = [] {
    Directive directive;
    directive.set_none(true);
    return directive;
  }();
  return none_only;
}

void Directive::AddKeyword(Keyword keyword) {
  DLOG_IF(WARNING, all_) << "Keyword on a directive that allows all sources";
  keywords_.set(ToIndex(keyword));
}

void Directive::RemoveKeyword(Keyword keyword) {
  keywords_.reset(ToIndex(keyword));
}

bool Directive::HasKeyword(Keyword keyword) const {
  return keywords_.test(ToIndex(keyword));
}

void Directive::AddScheme(Scheme scheme) {
  DLOG_IF(WARNING, all_) << "Scheme on a directive that allows all sources";
  schemes_.set(ToIndex(scheme));
}

void Directive::RemoveScheme(Scheme scheme) {
  schemes_.reset(ToIndex(scheme));
}

bool Directive::HasScheme(Scheme scheme) const {
  return schemes_.test(ToIndex(scheme));
}

void Directive::AddSource(std::string source) {
  DLOG_IF(WARNING, all_) << "Source " << source
                         << " on a directive that allows all sources";
  sources_.push_back(std::move(source));
}

void Directive::AddSources(std::initializer_list<std::string_view> sources) {
  sources_.reserve(sources_.size() + sources.size());
  for (std::string_view source : sources)
    AddSource(std::string(source));
}

void Directive::AddHash(HashAlgorithm algorithm, std::string_view content) {
  AddSource(ComputeHashSource(algorithm, content));
}

bool Directive::HasSource(std::string_view source) const {
  return std::find(sources_.begin(), sources_.end(), source) != sources_.end();
}

bool Directive::IsEmpty(std::string_view nonce_placeholder) const {
  if (all_ || schemes_.any() || !sources_.empty())
    return false;
  std::bitset<kNumKeywords> keywords = keywords_;
  if (nonce_placeholder.empty())
    keywords.reset(ToIndex(Keyword::kNonce));
  return keywords.none();
}

std::string Directive::Render(std::string_view nonce_placeholder) const {
  std::string output;
  AppendTo(nonce_placeholder, &output);
  return output;
}

void Directive::AppendTo(std::string_view nonce_placeholder,
                         std::string* output) const {
  if (all_) {
    output->append(kAll);
    return;
  }

  std::vector<std::string_view> tokens;
  tokens.reserve(keywords_.count() + schemes_.count() + sources_.size());
  for (size_t i = 0; i < kNumKeywords; ++i) {
    if (!keywords_.test(i))
      continue;
    if (i == ToIndex(Keyword::kNonce)) {
      if (!nonce_placeholder.empty())
        tokens.push_back(nonce_placeholder);
      continue;
    }
    tokens.push_back(kKeywordTokens[i]);
  }
  for (size_t i = 0; i < kNumSchemes; ++i) {
    if (schemes_.test(i))
      tokens.push_back(kSchemeTokens[i]);
  }
  for (const std::string& source : sources_)
    tokens.push_back(source);

  if (tokens.empty()) {
    output->append(kNone);
    return;
  }
  output->append(base::JoinString(tokens, " "));
}

std::string Directive::ToString() const {
  return Render(kDefaultNoncePlaceholder);
}

bool Directive::operator==(const Directive& other) const {
  return keywords_ == other.keywords_ && schemes_ == other.schemes_ &&
         sources_ == other.sources_ && all_ == other.all_ &&
         none_ == other.none_;
}

}  // namespace cspbuilder
