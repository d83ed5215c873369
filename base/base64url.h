// Copyright 2015 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_BASE64URL_H_
#define BASE_BASE64URL_H_

#include <string>
#include <string_view>

#include "base/base_export.h"

namespace base {

enum class Base64UrlEncodePolicy {
  // Include the trailing padding in the output, when necessary.
  INCLUDE_PADDING,

  // Remove the trailing padding from the output.
  OMIT_PADDING
};

// Encodes the |input| binary data in base64url, defined in RFC 4648, with the
// "-" and "_" characters standing in for "+" and "/".
BASE_EXPORT void Base64UrlEncode(std::string_view input,
                                 Base64UrlEncodePolicy policy,
                                 std::string* output);

enum class Base64UrlDecodePolicy {
  // Require inputs contain trailing padding if non-aligned.
  REQUIRE_PADDING,

  // Accept inputs regardless of whether or not they have the correct padding.
  IGNORE_PADDING,

  // Reject inputs if they contain any trailing padding.
  DISALLOW_PADDING
};

// Decodes the |input| string in base64url, defined in RFC 4648, into |output|.
// |policy| specifies whether padding should be accepted or rejected. Returns
// false when |input| is not valid base64url; |output| is left untouched then.
[[nodiscard]] BASE_EXPORT bool Base64UrlDecode(std::string_view input,
                                               Base64UrlDecodePolicy policy,
                                               std::string* output);

}  // namespace base

#endif  // BASE_BASE64URL_H_
