// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/openssl_util.h"

#include <openssl/err.h>

namespace crypto {

void ClearOpenSSLERRStack(const char* file, int line) {
  if (DCHECK_IS_ON() && VLOG_IS_ON(1)) {
    if (ERR_peek_error() == 0)
      return;

    DVLOG(1) << "OpenSSL ERR_get_error stack from " << file << ":" << line;
    unsigned long error;
    while ((error = ERR_get_error()) != 0) {
      char buf[256];
      ERR_error_string_n(error, buf, sizeof(buf));
      DVLOG(1) << "\t" << error << ": " << buf;
    }
  } else {
    ERR_clear_error();
  }
}

}  // namespace crypto
