// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/base64.h"

#include <limits.h>
#include <stddef.h>
#include <stdint.h>

#include <openssl/evp.h>

#include "base/logging.h"

namespace base {

std::string Base64Encode(std::string_view input) {
  std::string output;
  Base64Encode(input, &output);
  return output;
}

void Base64Encode(std::string_view input, std::string* output) {
  // EVP_EncodeBlock() takes an int length and writes four bytes for every
  // started three-byte group.
  CHECK_LE(input.size(), static_cast<size_t>(INT_MAX / 4 * 3));

  std::string temp;
  temp.resize(4 * ((input.size() + 2) / 3) + 1);  // makes room for null byte

  int output_size = EVP_EncodeBlock(
      reinterpret_cast<uint8_t*>(&temp[0]),
      reinterpret_cast<const uint8_t*>(input.data()),
      static_cast<int>(input.size()));

  temp.resize(static_cast<size_t>(output_size));  // strips off null byte
  output->swap(temp);
}

bool Base64Decode(std::string_view input, std::string* output) {
  if (input.size() % 4 != 0 || input.size() > static_cast<size_t>(INT_MAX))
    return false;

  size_t padding = 0;
  if (!input.empty() && input.back() == '=') {
    ++padding;
    if (input[input.size() - 2] == '=')
      ++padding;
  }
  // Padding may only terminate the input. EVP_DecodeBlock() would skip
  // surrounding whitespace, so it is rejected here.
  if (input.substr(0, input.size() - padding).find('=') !=
          std::string_view::npos ||
      input.find_first_of(" \t\n\r\f\v") != std::string_view::npos) {
    return false;
  }

  std::string temp;
  temp.resize(input.size() / 4 * 3 + 1);

  // EVP_DecodeBlock() decodes padding as zero bits.
  int output_size = EVP_DecodeBlock(
      reinterpret_cast<uint8_t*>(&temp[0]),
      reinterpret_cast<const uint8_t*>(input.data()),
      static_cast<int>(input.size()));
  if (output_size < 0 || static_cast<size_t>(output_size) < padding)
    return false;

  temp.resize(static_cast<size_t>(output_size) - padding);
  output->swap(temp);
  return true;
}

}  // namespace base
