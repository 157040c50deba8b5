/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "raffle/types.hpp"

namespace raffle {
  struct EnteredEvent {
    Address participant;
    bool operator==(const EnteredEvent &) const = default;
  };

  struct DrawRequestedEvent {
    RequestId request_id = 0;
    bool operator==(const DrawRequestedEvent &) const = default;
  };

  struct WinnerPickedEvent {
    Address winner;
    bool operator==(const WinnerPickedEvent &) const = default;
  };

  using RaffleEvent =
      std::variant<EnteredEvent, DrawRequestedEvent, WinnerPickedEvent>;

  /// Entry of the notification log
  struct EventRecord {
    uint64_t sequence = 0;
    Timestamp timestamp{};
    RaffleEvent event;
  };

  constexpr std::string_view eventName(const RaffleEvent &event) {
    switch (event.index()) {
      case 0:
        return "Entered";
      case 1:
        return "DrawRequested";
      case 2:
        return "WinnerPicked";
    }
    return "Unknown";
  }
}  // namespace raffle
