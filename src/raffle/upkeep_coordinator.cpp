/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/upkeep_coordinator.hpp"

#include <algorithm>

#include "metrics/metrics.hpp"
#include "payment/payment_rail.hpp"
#include "raffle/event_log.hpp"
#include "raffle/raffle_ledger.hpp"

namespace raffle {

  qtils::ByteVec TriggerConditions::encode() const {
    uint8_t flags = 0;
    flags |= is_open ? 1u : 0u;
    flags |= time_passed ? 2u : 0u;
    flags |= has_entrants ? 4u : 0u;
    flags |= has_balance ? 8u : 0u;
    qtils::ByteVec encoded;
    encoded.push_back(flags);
    return encoded;
  }

  UpkeepCoordinator::UpkeepCoordinator(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<RaffleLedger> ledger,
      qtils::SharedRef<randomness::RandomnessProvider> provider,
      qtils::SharedRef<payment::PaymentRail> payment_rail,
      qtils::SharedRef<clock::SteadyClock> steady_clock,
      qtils::SharedRef<EventLog> event_log,
      qtils::SharedRef<metrics::Metrics> metrics)
      : logger_{logsys->getLogger("UpkeepCoordinator", "raffle")},
        ledger_{std::move(ledger)},
        provider_{std::move(provider)},
        payment_rail_{std::move(payment_rail)},
        steady_clock_{std::move(steady_clock)},
        event_log_{std::move(event_log)},
        metrics_{std::move(metrics)} {}

  TriggerConditions UpkeepCoordinator::evaluate(
      const RaffleLedger::Cycle &cycle) const {
    auto elapsed = ledger_->now() - cycle.last_draw_timestamp;
    return TriggerConditions{
        .is_open = cycle.state == RaffleState::OPEN,
        .time_passed = elapsed > ledger_->interval(),
        .has_entrants = not cycle.entrants.empty(),
        .has_balance = cycle.pooled_balance > 0,
    };
  }

  TriggerNotSatisfied UpkeepCoordinator::snapshotOf(
      const RaffleLedger::Cycle &cycle) {
    return TriggerNotSatisfied{
        .balance = cycle.pooled_balance,
        .entrant_count = cycle.entrants.size(),
        .state = cycle.state,
    };
  }

  UpkeepCheck UpkeepCoordinator::evaluateTrigger() const {
    return ledger_->inspect([&](const RaffleLedger::Cycle &cycle) {
      auto conditions = evaluate(cycle);
      return UpkeepCheck{
          .upkeep_needed = conditions.satisfied(),
          .perform_data = conditions.encode(),
          .conditions = conditions,
          .snapshot = snapshotOf(cycle),
      };
    });
  }

  outcome::result<RequestId> UpkeepCoordinator::requestDraw(
      qtils::BytesIn perform_data, TriggerNotSatisfied *rejection) {
    return ledger_->modify(
        [&](RaffleLedger::Cycle &cycle) -> outcome::result<RequestId> {
          auto conditions = evaluate(cycle);
          if (not perform_data.empty()
              and not std::ranges::equal(perform_data, conditions.encode())) {
            SL_DEBUG(logger_, "Stale perform data, trigger re-evaluated");
          }

          if (not conditions.satisfied()) {
            auto snapshot = snapshotOf(cycle);
            metrics_->raffle_draws_rejected_total()->inc();
            SL_WARN(logger_,
                    "Upkeep not needed: balance {}, entrants {}, state {}",
                    snapshot.balance,
                    snapshot.entrant_count,
                    snapshot.state);
            if (rejection != nullptr) {
              *rejection = snapshot;
            }
            return RaffleError::TRIGGER_NOT_SATISFIED;
          }

          const auto &config = ledger_->config();
          auto request_res = provider_->requestRandomWords(
              randomness::RandomnessRequest{
                  .gas_lane = config.gas_lane,
                  .subscription_id = config.subscription_id,
                  .request_confirmations = config.request_confirmations,
                  .callback_gas_limit = config.callback_gas_limit,
                  .num_words = RaffleConfig::kNumWords,
              },
              weak_from_this());
          if (request_res.has_error()) {
            SL_ERROR(logger_,
                     "Randomness request refused: {}",
                     request_res.error());
            return request_res.error();
          }
          auto request_id = request_res.value();

          cycle.state = RaffleState::CALCULATING;
          cycle.pending_request = request_id;
          requested_at_ = steady_clock_->now();

          event_log_->append(DrawRequestedEvent{.request_id = request_id});
          metrics_->raffle_draws_requested_total()->inc();

          SL_INFO(logger_,
                  "Draw requested: request #{}, {} entries, pooled {}",
                  request_id,
                  cycle.entrants.size(),
                  cycle.pooled_balance);
          return request_id;
        });
  }

  void UpkeepCoordinator::ignoreFulfillment(RequestId request_id,
                                            RaffleError reason) const {
    metrics_->raffle_fulfillments_ignored_total()->inc();
    SL_WARN(logger_,
            "Fulfillment of request #{} ignored: {}",
            request_id,
            make_error_code(reason).message());
  }

  outcome::result<void> UpkeepCoordinator::fulfill(
      RequestId request_id, const std::vector<RandomWord> &random_words) {
    return ledger_->modify([&](RaffleLedger::Cycle &cycle) {
      return closeCycle(cycle, request_id, random_words);
    });
  }

  outcome::result<void> UpkeepCoordinator::closeCycle(
      RaffleLedger::Cycle &cycle,
      RequestId request_id,
      const std::vector<RandomWord> &random_words) {

    if (cycle.state != RaffleState::CALCULATING) {
      ignoreFulfillment(request_id, RaffleError::NOT_CALCULATING);
      return RaffleError::NOT_CALCULATING;
    }
    if (cycle.pending_request != request_id) {
      ignoreFulfillment(request_id, RaffleError::UNKNOWN_REQUEST);
      return RaffleError::UNKNOWN_REQUEST;
    }
    if (random_words.empty()) {
      ignoreFulfillment(request_id, RaffleError::NO_RANDOM_WORDS);
      return RaffleError::NO_RANDOM_WORDS;
    }
    // a draw is never requested with no entrants and nobody enters while
    // calculating
    if (cycle.entrants.empty()) {
      ignoreFulfillment(request_id, RaffleError::NO_ENTRANTS);
      return RaffleError::NO_ENTRANTS;
    }

    // count at fulfillment time is authoritative
    const auto entrant_count = cycle.entrants.size();
    const RandomWord index = random_words.front() % RandomWord{entrant_count};
    const auto winner_index = index.convert_to<size_t>();
    const auto winner = cycle.entrants[winner_index];
    const auto prize = cycle.pooled_balance;

    auto rollback = cycle;

    cycle.recent_winner = winner;
    cycle.entrants.clear();
    cycle.pending_request.reset();
    cycle.last_draw_timestamp = ledger_->now();
    cycle.state = RaffleState::OPEN;
    cycle.pooled_balance = 0;

    if (auto res = payment_rail_->transfer(winner, prize); res.has_error()) {
      cycle = std::move(rollback);
      metrics_->raffle_payout_failures_total()->inc();
      SL_ERROR(logger_,
               "Payout of {} to {} failed: {}; request #{} rolled back, "
               "raffle stays {}",
               prize,
               toString(winner),
               res.error(),
               request_id,
               cycle.state);
      return RaffleError::PAYOUT_TRANSFER_FAILED;
    }

    event_log_->append(WinnerPickedEvent{.winner = winner});
    metrics_->raffle_winners_picked_total()->inc();
    if (requested_at_.has_value()) {
      std::chrono::duration<double> latency =
          steady_clock_->now() - *requested_at_;
      metrics_->raffle_draw_duration_seconds()->observe(latency.count());
      requested_at_.reset();
    }

    SL_INFO(logger_,
            "Winner picked: {} (entry {} of {}), prize {}",
            toString(winner),
            winner_index,
            entrant_count,
            prize);
    return outcome::success();
  }

  outcome::result<void> UpkeepCoordinator::fulfillRandomWords(
      RequestId request_id, const std::vector<RandomWord> &random_words) {
    return fulfill(request_id, random_words);
  }

}  // namespace raffle
