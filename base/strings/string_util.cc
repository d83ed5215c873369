// Copyright 2013 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/strings/string_util.h"

#include <stddef.h>

#include <iterator>

namespace base {

namespace {

// Generic version for all JoinString overloads. |list_type| must be a sequence
// (std::vector or std::initializer_list) of strings/StringPieces.
template <typename list_type>
std::string JoinStringT(const list_type& parts, std::string_view sep) {
  if (std::empty(parts))
    return std::string();

  // Pre-allocate the eventual size of the string. Start with the size of all of
  // the separators (note that this *assumes* parts.size() > 0).
  size_t total_size = (parts.size() - 1) * sep.size();
  for (const auto& part : parts)
    total_size += part.size();
  std::string result;
  result.reserve(total_size);

  auto iter = parts.begin();
  result.append(iter->data(), iter->size());
  ++iter;

  for (; iter != parts.end(); ++iter) {
    result.append(sep.data(), sep.size());
    result.append(iter->data(), iter->size());
  }

  return result;
}

}  // namespace

bool EndsWith(std::string_view str, std::string_view search_for) {
  if (search_for.size() > str.size())
    return false;
  return str.substr(str.size() - search_for.size()) == search_for;
}

size_t ReplaceSubstringsAfterOffset(std::string* str,
                                    size_t start_offset,
                                    std::string_view find_this,
                                    std::string_view replace_with) {
  if (find_this.empty() || start_offset >= str->size())
    return 0;

  // Build the result in a scratch buffer so that each match is copied once,
  // whatever the relative lengths of |find_this| and |replace_with|.
  size_t first_match = str->find(find_this.data(), start_offset,
                                 find_this.size());
  if (first_match == std::string::npos)
    return 0;

  std::string result;
  result.reserve(str->size());
  result.append(*str, 0, first_match);

  size_t num_replacements = 0;
  size_t read_offset = first_match;
  for (size_t match = first_match; match != std::string::npos;
       match = str->find(find_this.data(), read_offset, find_this.size())) {
    result.append(*str, read_offset, match - read_offset);
    result.append(replace_with.data(), replace_with.size());
    read_offset = match + find_this.size();
    ++num_replacements;
  }
  result.append(*str, read_offset, std::string::npos);

  str->swap(result);
  return num_replacements;
}

std::string JoinString(const std::vector<std::string>& parts,
                       std::string_view separator) {
  return JoinStringT(parts, separator);
}

std::string JoinString(const std::vector<std::string_view>& parts,
                       std::string_view separator) {
  return JoinStringT(parts, separator);
}

std::string JoinString(std::initializer_list<std::string_view> parts,
                       std::string_view separator) {
  return JoinStringT(parts, separator);
}

}  // namespace base
