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

#include "cspbuilder/csp_constants.h"

namespace cspbuilder {

const char kContentSecurityPolicyHeader[] = "Content-Security-Policy";
const char kContentSecurityPolicyReportOnlyHeader[] =
    "Content-Security-Policy-Report-Only";

const char kDefaultSrc[] = "default-src";
const char kConnectSrc[] = "connect-src";
const char kFontSrc[] = "font-src";
const char kFrameSrc[] = "frame-src";
const char kImgSrc[] = "img-src";
const char kMediaSrc[] = "media-src";
const char kObjectSrc[] = "object-src";
const char kSandbox[] = "sandbox";
const char kScriptSrc[] = "script-src";
const char kStyleSrc[] = "style-src";

const char kBaseUri[] = "base-uri";
const char kChildSrc[] = "child-src";
const char kFrameAncestors[] = "frame-ancestors";
const char kPluginTypes[] = "plugin-types";
const char kFormAction[] = "form-action";

const char kTrustedTypes[] = "trusted-types";
const char kRequireTrustedTypesFor[] = "require-trusted-types-for";
const char kStyleSrcAttr[] = "style-src-attr";
const char kStyleSrcElem[] = "style-src-elem";
const char kScriptSrcAttr[] = "script-src-attr";
const char kScriptSrcElem[] = "script-src-elem";
const char kWorkerSrc[] = "worker-src";
const char kNavigateTo[] = "navigate-to";
const char kPrefetchSrc[] = "prefetch-src";
const char kManifestSrc[] = "manifest-src";
const char kReportTo[] = "report-to";

const char kUpgradeInsecureRequests[] = "upgrade-insecure-requests";
const char kReportUri[] = "report-uri";

const char kNone[] = "'none'";
const char kAll[] = "*";
const char kSelf[] = "'self'";
const char kStrictDynamic[] = "'strict-dynamic'";
const char kUnsafeEval[] = "'unsafe-eval'";
const char kUnsafeInline[] = "'unsafe-inline'";
const char kUnsafeHashes[] = "'unsafe-hashes'";
const char kUnsafeAllowRedirects[] = "'unsafe-allow-redirects'";
const char kReportSample[] = "'report-sample'";
const char kTrustedScript[] = "'script'";

const char kBlob[] = "blob:";
const char kData[] = "data:";
const char kMediastream[] = "mediastream:";
const char kFilesystem[] = "filesystem:";

const char kDefaultNoncePlaceholder[] = "$NONCE";

}  // namespace cspbuilder
