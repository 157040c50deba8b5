/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle_ledger.hpp"

#include <limits>

#include "clock/clock.hpp"
#include "metrics/metrics.hpp"
#include "raffle/event_log.hpp"

namespace raffle {

  RaffleLedger::RaffleLedger(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<clock::SystemClock> clock,
                             qtils::SharedRef<EventLog> event_log,
                             qtils::SharedRef<metrics::Metrics> metrics,
                             RaffleConfig config)
      : logger_{logsys->getLogger("RaffleLedger", "raffle")},
        clock_{std::move(clock)},
        event_log_{std::move(event_log)},
        metrics_{std::move(metrics)},
        config_{std::move(config)} {
    cycle_.last_draw_timestamp = clock_->now();
    updateGauges();
    SL_INFO(logger_,
            "Raffle opened: entrance fee {}, interval {}ms",
            config_.entrance_fee,
            config_.interval.count());
  }

  outcome::result<void> RaffleLedger::deposit(const Address &caller,
                                              const Amount &amount) {
    std::lock_guard lock{mutex_};

    if (amount < config_.entrance_fee) {
      SL_DEBUG(logger_,
               "Deposit of {} from {} is below the entrance fee",
               amount,
               toString(caller));
      metrics_->raffle_rejected_entries_total({{"reason", "stake"}})->inc();
      return RaffleError::INSUFFICIENT_STAKE;
    }
    if (cycle_.state != RaffleState::OPEN) {
      SL_DEBUG(logger_,
               "Deposit from {} rejected, raffle is {}",
               toString(caller),
               cycle_.state);
      metrics_->raffle_rejected_entries_total({{"reason", "not_open"}})->inc();
      return RaffleError::NOT_OPEN;
    }
    if (amount > std::numeric_limits<Amount>::max() - cycle_.pooled_balance) {
      SL_WARN(logger_,
              "Deposit of {} from {} would overflow the pooled balance {}",
              amount,
              toString(caller),
              cycle_.pooled_balance);
      metrics_->raffle_rejected_entries_total({{"reason", "overflow"}})->inc();
      return RaffleError::BALANCE_OVERFLOW;
    }

    cycle_.entrants.emplace_back(caller);
    cycle_.pooled_balance += amount;

    event_log_->append(EnteredEvent{.participant = caller});
    metrics_->raffle_entries_total()->inc();
    updateGauges();

    SL_VERBOSE(logger_,
               "Entered {} with {}; {} entries, pooled {}",
               toString(caller),
               amount,
               cycle_.entrants.size(),
               cycle_.pooled_balance);
    return outcome::success();
  }

  outcome::result<Address> RaffleLedger::entrantAt(size_t index) const {
    std::lock_guard lock{mutex_};
    if (index >= cycle_.entrants.size()) {
      return RaffleError::INDEX_OUT_OF_RANGE;
    }
    return cycle_.entrants[index];
  }

  size_t RaffleLedger::entrantCount() const {
    std::lock_guard lock{mutex_};
    return cycle_.entrants.size();
  }

  Amount RaffleLedger::pooledBalance() const {
    std::lock_guard lock{mutex_};
    return cycle_.pooled_balance;
  }

  std::optional<Address> RaffleLedger::mostRecentWinner() const {
    std::lock_guard lock{mutex_};
    return cycle_.recent_winner;
  }

  RaffleState RaffleLedger::currentState() const {
    std::lock_guard lock{mutex_};
    return cycle_.state;
  }

  Timestamp RaffleLedger::lastDrawTimestamp() const {
    std::lock_guard lock{mutex_};
    return cycle_.last_draw_timestamp;
  }

  CycleSnapshot RaffleLedger::snapshot() const {
    std::lock_guard lock{mutex_};
    return CycleSnapshot{
        .state = cycle_.state,
        .entrant_count = cycle_.entrants.size(),
        .pooled_balance = cycle_.pooled_balance,
        .last_draw_timestamp = cycle_.last_draw_timestamp,
        .recent_winner = cycle_.recent_winner,
        .pending_request = cycle_.pending_request,
    };
  }

  Timestamp RaffleLedger::now() const {
    return clock_->now();
  }

  void RaffleLedger::updateGauges() const {
    metrics_->raffle_state()->set(static_cast<uint8_t>(cycle_.state));
    metrics_->raffle_entrants()->set(cycle_.entrants.size());
    metrics_->raffle_pooled_balance()->set(
        cycle_.pooled_balance.convert_to<double>());
  }

}  // namespace raffle
