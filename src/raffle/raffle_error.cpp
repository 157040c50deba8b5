/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(raffle, RaffleError, e) {
  using E = raffle::RaffleError;
  switch (e) {
    case E::INSUFFICIENT_STAKE:
      return "Not enough value sent to enter the raffle";
    case E::NOT_OPEN:
      return "Raffle is not open";
    case E::TRIGGER_NOT_SATISFIED:
      return "Upkeep not needed";
    case E::INDEX_OUT_OF_RANGE:
      return "Entrant index out of range";
    case E::PAYOUT_TRANSFER_FAILED:
      return "Transfer to the winner failed";
    case E::NOT_CALCULATING:
      return "Raffle has no draw in flight";
    case E::UNKNOWN_REQUEST:
      return "Request id does not match the pending request";
    case E::NO_RANDOM_WORDS:
      return "No random words delivered";
    case E::NO_ENTRANTS:
      return "Raffle has no entrants";
    case E::BALANCE_OVERFLOW:
      return "Pooled balance overflow";
  }
  return "Unknown raffle error";
}
