/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "randomness/randomness_provider.hpp"
#include "raffle/raffle_error.hpp"
#include "raffle/raffle_ledger.hpp"

namespace raffle::metrics {
  class Metrics;
}  // namespace raffle::metrics

namespace raffle::payment {
  class PaymentRail;
}  // namespace raffle::payment

namespace raffle {
  class EventLog;

  /// The four sub-conditions of the draw trigger
  struct TriggerConditions {
    bool is_open = false;
    bool time_passed = false;
    bool has_entrants = false;
    bool has_balance = false;

    bool satisfied() const {
      return is_open and time_passed and has_entrants and has_balance;
    }

    /// One byte bitmask, bit 0 is `is_open`
    qtils::ByteVec encode() const;

    bool operator==(const TriggerConditions &) const = default;
  };

  /// Result of evaluateTrigger
  struct UpkeepCheck {
    bool upkeep_needed = false;
    /// Opaque diagnostic, may be passed back to requestDraw
    qtils::ByteVec perform_data;
    TriggerConditions conditions;
    TriggerNotSatisfied snapshot;
  };

  /**
   * Gates draw triggering, owns the randomness request lifecycle and closes
   * cycles when random words are delivered.
   */
  class UpkeepCoordinator
      : public randomness::RandomnessConsumer,
        public std::enable_shared_from_this<UpkeepCoordinator> {
   public:
    UpkeepCoordinator(qtils::SharedRef<log::LoggingSystem> logsys,
                      qtils::SharedRef<RaffleLedger> ledger,
                      qtils::SharedRef<randomness::RandomnessProvider> provider,
                      qtils::SharedRef<payment::PaymentRail> payment_rail,
                      qtils::SharedRef<clock::SteadyClock> steady_clock,
                      qtils::SharedRef<EventLog> event_log,
                      qtils::SharedRef<metrics::Metrics> metrics);

    /**
     * Evaluates the draw trigger without changing anything
     */
    UpkeepCheck evaluateTrigger() const;

    /**
     * Re-evaluates the trigger and, if it holds, moves the raffle to
     * CALCULATING and issues exactly one randomness request.
     * @param perform_data diagnostic from evaluateTrigger; informational only
     * @param rejection receives the cycle snapshot on TRIGGER_NOT_SATISFIED
     * @return id of the pending request, TRIGGER_NOT_SATISFIED or the
     * provider's error
     */
    outcome::result<RequestId> requestDraw(
        qtils::BytesIn perform_data = {},
        TriggerNotSatisfied *rejection = nullptr);

    /**
     * Closes the cycle: picks the winner with `words[0] mod entrantCount`,
     * resets the ledger and pays the whole pooled balance out. Nothing is
     * changed on any error.
     */
    outcome::result<void> fulfill(RequestId request_id,
                                  const std::vector<RandomWord> &random_words);

    outcome::result<void> fulfillRandomWords(
        RequestId request_id,
        const std::vector<RandomWord> &random_words) override;

   private:
    TriggerConditions evaluate(const RaffleLedger::Cycle &cycle) const;
    static TriggerNotSatisfied snapshotOf(const RaffleLedger::Cycle &cycle);
    outcome::result<void> closeCycle(
        RaffleLedger::Cycle &cycle,
        RequestId request_id,
        const std::vector<RandomWord> &random_words);
    void ignoreFulfillment(RequestId request_id, RaffleError reason) const;

    log::Logger logger_;
    qtils::SharedRef<RaffleLedger> ledger_;
    qtils::SharedRef<randomness::RandomnessProvider> provider_;
    qtils::SharedRef<payment::PaymentRail> payment_rail_;
    qtils::SharedRef<clock::SteadyClock> steady_clock_;
    qtils::SharedRef<EventLog> event_log_;
    qtils::SharedRef<metrics::Metrics> metrics_;

    // guarded by the ledger lock
    std::optional<clock::SteadyClock::TimePoint> requested_at_;
  };

}  // namespace raffle
