/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <qtils/byte_arr.hpp>

namespace raffle {
  /// Payable identity of an entrant or winner
  using Address = qtils::ByteArr<20>;

  /// Value in the smallest currency unit
  using Amount = boost::multiprecision::uint256_t;

  /// Unsigned word delivered by the randomness provider
  using RandomWord = boost::multiprecision::uint256_t;

  using RequestId = uint64_t;
  using SubscriptionId = uint64_t;

  /// Randomness provider lane (key hash)
  using GasLane = qtils::ByteArr<32>;

  /// Milliseconds since unix epoch
  using Timestamp = std::chrono::milliseconds;

  inline std::string toString(const Address &address) {
    return fmt::format("0x{}", address.toHex());
  }
}  // namespace raffle

template <>
struct fmt::formatter<raffle::Amount> : fmt::formatter<std::string_view> {
  auto format(const raffle::Amount &value, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(value.str(), ctx);
  }
};
