/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "raffle/raffle_config.hpp"
#include "raffle/raffle_error.hpp"
#include "raffle/raffle_state.hpp"

namespace raffle::clock {
  class SystemClock;
}  // namespace raffle::clock

namespace raffle::metrics {
  class Metrics;
}  // namespace raffle::metrics

namespace raffle {
  class EventLog;

  /// Consistent view of the current cycle
  struct CycleSnapshot {
    RaffleState state = RaffleState::OPEN;
    size_t entrant_count = 0;
    Amount pooled_balance;
    Timestamp last_draw_timestamp{};
    std::optional<Address> recent_winner;
    std::optional<RequestId> pending_request;
  };

  /**
   * Entrants, pooled balance and lifecycle metadata of one raffle.
   *
   * Owns the raffle lock. Every public method takes it for its whole
   * duration; UpkeepCoordinator takes the same lock for draw requests and
   * fulfillments.
   */
  class RaffleLedger {
   public:
    RaffleLedger(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<clock::SystemClock> clock,
                 qtils::SharedRef<EventLog> event_log,
                 qtils::SharedRef<metrics::Metrics> metrics,
                 RaffleConfig config);

    /// Cycle state behind the raffle lock
    struct Cycle {
      RaffleState state = RaffleState::OPEN;
      std::vector<Address> entrants;
      Amount pooled_balance;
      Timestamp last_draw_timestamp{};
      std::optional<Address> recent_winner;
      std::optional<RequestId> pending_request;
    };

    /**
     * Enters `caller` once for `amount`.
     * @return INSUFFICIENT_STAKE if amount is below the entrance fee,
     * NOT_OPEN if a draw is in flight, BALANCE_OVERFLOW if the pool can't
     * hold `amount` more
     */
    outcome::result<void> deposit(const Address &caller, const Amount &amount);

    outcome::result<Address> entrantAt(size_t index) const;

    size_t entrantCount() const;
    Amount pooledBalance() const;
    std::optional<Address> mostRecentWinner() const;
    RaffleState currentState() const;
    Timestamp lastDrawTimestamp() const;

    CycleSnapshot snapshot() const;

    /**
     * Runs `fn(Cycle &)` under the raffle lock, then refreshes the cycle
     * gauges. `fn` must not call the locking ledger methods.
     */
    template <typename F>
    auto modify(F &&fn) {
      std::lock_guard lock{mutex_};
      auto result = std::forward<F>(fn)(cycle_);
      updateGauges();
      return result;
    }

    /// Runs `fn(const Cycle &)` under the raffle lock
    template <typename F>
    auto inspect(F &&fn) const {
      std::lock_guard lock{mutex_};
      return std::forward<F>(fn)(std::as_const(cycle_));
    }

    Timestamp now() const;

    const RaffleConfig &config() const {
      return config_;
    }
    const Amount &entranceFee() const {
      return config_.entrance_fee;
    }
    std::chrono::milliseconds interval() const {
      return config_.interval;
    }
    uint16_t requestConfirmations() const {
      return config_.request_confirmations;
    }
    uint32_t numWords() const {
      return RaffleConfig::kNumWords;
    }

   private:
    // mutex_ must be held
    void updateGauges() const;

    log::Logger logger_;
    qtils::SharedRef<clock::SystemClock> clock_;
    qtils::SharedRef<EventLog> event_log_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    const RaffleConfig config_;

    mutable std::mutex mutex_;
    Cycle cycle_;
  };

}  // namespace raffle
