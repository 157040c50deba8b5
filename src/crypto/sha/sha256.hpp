/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/byte_arr.hpp>
#include <qtils/byte_view.hpp>

namespace raffle::crypto {
  using Hash256 = qtils::ByteArr<32>;

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::ByteView input);

  Hash256 sha256(std::string_view input);

}  // namespace raffle::crypto
