/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

#include "raffle/raffle_state.hpp"
#include "raffle/types.hpp"

namespace raffle {
  enum class RaffleError : uint8_t {
    INSUFFICIENT_STAKE = 1,  ///< deposit below the entrance fee
    NOT_OPEN,                ///< deposit while a draw is in flight
    TRIGGER_NOT_SATISFIED,   ///< draw requested before it is due
    INDEX_OUT_OF_RANGE,      ///< no entrant at the queried index
    PAYOUT_TRANSFER_FAILED,  ///< winner payout refused, cycle rolled back
    NOT_CALCULATING,         ///< fulfillment while no draw is in flight
    UNKNOWN_REQUEST,         ///< fulfillment for a request that isn't pending
    NO_RANDOM_WORDS,         ///< fulfillment carries no words
    NO_ENTRANTS,             ///< nobody to draw from
    BALANCE_OVERFLOW,        ///< deposit would overflow the pooled balance
  };

  /**
   * Snapshot attached to a TRIGGER_NOT_SATISFIED rejection
   */
  struct TriggerNotSatisfied {
    Amount balance;
    size_t entrant_count = 0;
    RaffleState state = RaffleState::OPEN;

    bool operator==(const TriggerNotSatisfied &) const = default;
  };
}  // namespace raffle

OUTCOME_HPP_DECLARE_ERROR(raffle, RaffleError);
