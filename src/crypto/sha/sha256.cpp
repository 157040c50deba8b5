/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <new>

#include <openssl/evp.h>

namespace raffle::crypto {
  Hash256 sha256(qtils::ByteView input) {
    Hash256 out;
    unsigned int size = 0;
    // one-shot digest can only fail on allocation
    if (EVP_Digest(input.data(),
                   input.size(),
                   out.data(),
                   &size,
                   EVP_sha256(),
                   nullptr)
        != 1) {
      throw std::bad_alloc();
    }
    return out;
  }

  Hash256 sha256(std::string_view input) {
    return sha256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }
}  // namespace raffle::crypto
