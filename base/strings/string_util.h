// Copyright 2013 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//
// This file defines utility functions for working with strings.

#ifndef BASE_STRINGS_STRING_UTIL_H_
#define BASE_STRINGS_STRING_UTIL_H_

#include <stddef.h>

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "base/base_export.h"

namespace base {

// Returns true if |str| ends with |search_for|. Case sensitive.
BASE_EXPORT bool EndsWith(std::string_view str, std::string_view search_for);

// Starting at |start_offset| (usually 0), look through |str| and replace all
// instances of |find_this| with |replace_with|. Returns the number of
// replacements made.
//
// This does entire substrings; use std::replace in <algorithm> for single
// characters, for example:
//   std::replace(str.begin(), str.end(), 'a', 'b');
BASE_EXPORT size_t ReplaceSubstringsAfterOffset(std::string* str,
                                                size_t start_offset,
                                                std::string_view find_this,
                                                std::string_view replace_with);

// Joins a vector or list of strings into a single string, inserting
// |separator| (which may be empty) in between all elements.
BASE_EXPORT std::string JoinString(const std::vector<std::string>& parts,
                                   std::string_view separator);
BASE_EXPORT std::string JoinString(const std::vector<std::string_view>& parts,
                                   std::string_view separator);
// Explicit initializer_list overloads are required to break ambiguity when used
// with a literal initializer list (otherwise the compiler would not be able to
// decide between the std::string and std::string_view overloads).
BASE_EXPORT std::string JoinString(
    std::initializer_list<std::string_view> parts,
    std::string_view separator);

}  // namespace base

#endif  // BASE_STRINGS_STRING_UTIL_H_
