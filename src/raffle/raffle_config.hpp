/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "raffle/types.hpp"

namespace raffle {
  /**
   * Immutable parameters of one raffle instance.
   * Set once at creation and never changed afterwards.
   */
  struct RaffleConfig {
    Amount entrance_fee;
    std::chrono::milliseconds interval{std::chrono::seconds{30}};

    // randomness request routing
    GasLane gas_lane;
    SubscriptionId subscription_id = 0;
    uint16_t request_confirmations = 3;
    uint32_t callback_gas_limit = 500'000;

    static constexpr uint32_t kNumWords = 1;
  };
}  // namespace raffle
