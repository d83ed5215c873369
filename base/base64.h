// Copyright 2011 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_BASE64_H_
#define BASE_BASE64_H_

#include <string>
#include <string_view>

#include "base/base_export.h"

namespace base {

// Encodes the input binary data in base64, using the standard alphabet and
// '=' padding.
BASE_EXPORT std::string Base64Encode(std::string_view input);

// Encodes the input string in base64. The encoding can be done in-place.
BASE_EXPORT void Base64Encode(std::string_view input, std::string* output);

// Decodes the base64 input string.  Returns true if successful and false
// otherwise. The output string is only modified if successful. The decoding can
// be done in-place. Padding is required and whitespace is rejected.
[[nodiscard]] BASE_EXPORT bool Base64Decode(std::string_view input,
                                            std::string* output);

}  // namespace base

#endif  // BASE_BASE64_H_
