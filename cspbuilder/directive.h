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

#ifndef CSPBUILDER_DIRECTIVE_H_
#define CSPBUILDER_DIRECTIVE_H_

#include <bitset>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "cspbuilder/cspbuilder_export.h"
#include "cspbuilder/hash_source.h"

namespace cspbuilder {

// Directive is the source list of one CSP directive, without its name. It is
// a plain value: copying a Directive copies its sources, and its rendered
// form depends on nothing but its fields.
//
// Rendering follows a fixed precedence:
//   1. all() set: "*", whatever else is set.
//   2. Nothing to emit: "'none'". The none() flag alone renders this way;
//      none() set next to other sources is ignored.
//   3. Otherwise the keyword flags in Keyword order, then the scheme flags in
//      Scheme order, then every literal source in insertion order, separated
//      by single spaces.
class CSPBUILDER_EXPORT Directive {
 public:
  // Keyword-sources, declared in render order. kNonce renders as the nonce
  // placeholder of the policy doing the rendering.
  enum class Keyword {
    kNonce,
    kStrictDynamic,
    kSelf,
    kUnsafeInline,
    kUnsafeEval,
    kUnsafeAllowRedirects,
    kUnsafeHashes,
    kMaxValue = kUnsafeHashes,
  };

  // Scheme-sources, declared in render order. They render after keywords.
  enum class Scheme {
    kBlob,
    kData,
    kMediastream,
    kFilesystem,
    kMaxValue = kFilesystem,
  };

  Directive();
  // Creates a directive whose literal sources are |sources|, in order.
  explicit Directive(std::initializer_list<std::string_view> sources);
  Directive(const Directive& other);
  Directive(Directive&& other) noexcept;
  Directive& operator=(const Directive& other);
  Directive& operator=(Directive&& other) noexcept;
  ~Directive();

  // Canonical shared directives: 'self' alone and 'none'. They are handed out
  // as const references, so sources cannot be added to them; copy one to
  // start from it.
  static const Directive& SelfOnly();
  static const Directive& NoneOnly();

  void AddKeyword(Keyword keyword);
  void RemoveKeyword(Keyword keyword);
  bool HasKeyword(Keyword keyword) const;

  void AddScheme(Scheme scheme);
  void RemoveScheme(Scheme scheme);
  bool HasScheme(Scheme scheme) const;

  // Appends a literal source (origin, scheme, quoted keyword or hash). The
  // source is emitted verbatim; the caller is responsible for its syntax.
  void AddSource(std::string source);
  void AddSources(std::initializer_list<std::string_view> sources);

  // Hashes |content| with |algorithm| and appends the resulting hash-source.
  void AddHash(HashAlgorithm algorithm, std::string_view content);

  void set_all(bool all) { all_ = all; }
  bool all() const { return all_; }

  void set_none(bool none) { none_ = none; }
  bool none() const { return none_; }

  const std::vector<std::string>& sources() const { return sources_; }

  // True if |source| was added as a literal source.
  bool HasSource(std::string_view source) const;

  // True when the directive asks for a per-response nonce.
  bool requires_nonce() const { return HasKeyword(Keyword::kNonce); }

  // Returns the source list. |nonce_placeholder| stands in for the kNonce
  // keyword; an empty placeholder leaves the nonce out.
  std::string Render(std::string_view nonce_placeholder) const;

  // True if Render(|nonce_placeholder|) would produce no source tokens, i.e.
  // it falls back to 'none'.
  bool IsEmpty(std::string_view nonce_placeholder) const;

  // Same as Render(), appending to |output|.
  void AppendTo(std::string_view nonce_placeholder, std::string* output) const;

  // Render() with kDefaultNoncePlaceholder.
  std::string ToString() const;

  bool operator==(const Directive& other) const;
  bool operator!=(const Directive& other) const { return !(*this == other); }

 private:
  static constexpr size_t kNumKeywords =
      static_cast<size_t>(Keyword::kMaxValue) + 1;
  static constexpr size_t kNumSchemes =
      static_cast<size_t>(Scheme::kMaxValue) + 1;

  std::bitset<kNumKeywords> keywords_;
  std::bitset<kNumSchemes> schemes_;
  std::vector<std::string> sources_;
  bool all_ = false;
  bool none_ = false;
};

}  // namespace cspbuilder

#endif  // CSPBUILDER_DIRECTIVE_H_
