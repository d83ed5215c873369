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

#ifndef CSPBUILDER_CSP_CONSTANTS_H_
#define CSPBUILDER_CSP_CONSTANTS_H_

#include "cspbuilder/cspbuilder_export.h"

namespace cspbuilder {

// Response header names.
CSPBUILDER_EXPORT extern const char kContentSecurityPolicyHeader[];
CSPBUILDER_EXPORT extern const char kContentSecurityPolicyReportOnlyHeader[];

// Well-known directive names. A Policy accepts any other name verbatim, so
// directives from newer CSP drafts need no entry here.
//
// CSP level 1.
CSPBUILDER_EXPORT extern const char kDefaultSrc[];
CSPBUILDER_EXPORT extern const char kConnectSrc[];
CSPBUILDER_EXPORT extern const char kFontSrc[];
CSPBUILDER_EXPORT extern const char kFrameSrc[];
CSPBUILDER_EXPORT extern const char kImgSrc[];
CSPBUILDER_EXPORT extern const char kMediaSrc[];
CSPBUILDER_EXPORT extern const char kObjectSrc[];
CSPBUILDER_EXPORT extern const char kSandbox[];
CSPBUILDER_EXPORT extern const char kScriptSrc[];
CSPBUILDER_EXPORT extern const char kStyleSrc[];
// CSP level 2.
CSPBUILDER_EXPORT extern const char kBaseUri[];
CSPBUILDER_EXPORT extern const char kChildSrc[];
CSPBUILDER_EXPORT extern const char kFrameAncestors[];
CSPBUILDER_EXPORT extern const char kPluginTypes[];
CSPBUILDER_EXPORT extern const char kFormAction[];
// CSP level 3.
CSPBUILDER_EXPORT extern const char kTrustedTypes[];
CSPBUILDER_EXPORT extern const char kRequireTrustedTypesFor[];
CSPBUILDER_EXPORT extern const char kStyleSrcAttr[];
CSPBUILDER_EXPORT extern const char kStyleSrcElem[];
CSPBUILDER_EXPORT extern const char kScriptSrcAttr[];
CSPBUILDER_EXPORT extern const char kScriptSrcElem[];
CSPBUILDER_EXPORT extern const char kWorkerSrc[];
CSPBUILDER_EXPORT extern const char kNavigateTo[];
CSPBUILDER_EXPORT extern const char kPrefetchSrc[];
CSPBUILDER_EXPORT extern const char kManifestSrc[];
CSPBUILDER_EXPORT extern const char kReportTo[];

// Policy-wide directives appended after the source-list directives.
CSPBUILDER_EXPORT extern const char kUpgradeInsecureRequests[];
CSPBUILDER_EXPORT extern const char kReportUri[];

// Keyword-sources and scheme-sources, usable as literal sources for callers
// that prefer strings over Directive::Keyword and Directive::Scheme.
CSPBUILDER_EXPORT extern const char kNone[];
CSPBUILDER_EXPORT extern const char kAll[];
CSPBUILDER_EXPORT extern const char kSelf[];
CSPBUILDER_EXPORT extern const char kStrictDynamic[];
CSPBUILDER_EXPORT extern const char kUnsafeEval[];
CSPBUILDER_EXPORT extern const char kUnsafeInline[];
CSPBUILDER_EXPORT extern const char kUnsafeHashes[];
CSPBUILDER_EXPORT extern const char kUnsafeAllowRedirects[];
CSPBUILDER_EXPORT extern const char kReportSample[];
// The 'script' sink group of require-trusted-types-for.
CSPBUILDER_EXPORT extern const char kTrustedScript[];

CSPBUILDER_EXPORT extern const char kBlob[];
CSPBUILDER_EXPORT extern const char kData[];
CSPBUILDER_EXPORT extern const char kMediastream[];
CSPBUILDER_EXPORT extern const char kFilesystem[];

// Token a compiled policy carries wherever a nonce-source belongs, until
// Policy::WithNonce() substitutes a fresh 'nonce-...' source for it.
CSPBUILDER_EXPORT extern const char kDefaultNoncePlaceholder[];

}  // namespace cspbuilder

#endif  // CSPBUILDER_CSP_CONSTANTS_H_
