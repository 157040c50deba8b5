/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace raffle {
  /**
   * Lifecycle of a raffle cycle.
   * OPEN accepts entries and may be drawn once the trigger holds.
   * CALCULATING has exactly one randomness request in flight.
   */
  enum class RaffleState : uint8_t {
    OPEN = 0,
    CALCULATING = 1,
  };

  constexpr std::string_view toString(RaffleState state) {
    switch (state) {
      case RaffleState::OPEN:
        return "OPEN";
      case RaffleState::CALCULATING:
        return "CALCULATING";
    }
    return "UNKNOWN";
  }
}  // namespace raffle

template <>
struct fmt::formatter<raffle::RaffleState> : fmt::formatter<std::string_view> {
  auto format(raffle::RaffleState state, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(raffle::toString(state),
                                                    ctx);
  }
};
