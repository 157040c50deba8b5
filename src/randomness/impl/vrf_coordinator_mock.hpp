/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include <qtils/enum_error_code.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "randomness/randomness_provider.hpp"

namespace raffle::randomness {

  /**
   * In-process stand-in for a VRF coordinator.
   *
   * Requests are billed against funded subscriptions and stay pending until
   * `fulfillRandomWords` is called for them. Words are derived
   * deterministically from the request id, so a draw can be replayed.
   */
  class VrfCoordinatorMock final : public RandomnessProvider {
   public:
    enum class Error : uint8_t {
      INVALID_SUBSCRIPTION = 1,
      INVALID_NUM_WORDS,
      NONEXISTENT_REQUEST,
      INSUFFICIENT_BALANCE,
      WORD_COUNT_MISMATCH,
    };

    struct Config {
      /// Flat fee per fulfillment, in juels
      Amount base_fee;
      /// Juels per unit of callback gas
      Amount gas_price_link;
    };

    struct Subscription {
      Amount balance;
      uint64_t request_count = 0;
    };

    /// Outcome of a delivered request
    struct Fulfillment {
      RequestId request_id = 0;
      Amount payment;
      /// whether the consumer accepted the words
      bool success = false;
    };

    static constexpr uint32_t kMaxNumWords = 500;

    VrfCoordinatorMock(qtils::SharedRef<log::LoggingSystem> logsys,
                       Config config);

    outcome::result<RequestId> requestRandomWords(
        const RandomnessRequest &request,
        std::weak_ptr<RandomnessConsumer> consumer) override;

    SubscriptionId createSubscription();
    outcome::result<void> fundSubscription(SubscriptionId subscription_id,
                                           const Amount &amount);
    outcome::result<Subscription> getSubscription(
        SubscriptionId subscription_id) const;

    /**
     * Delivers words derived from the request id.
     * The request is consumed even if the consumer rejects the words.
     * @return NONEXISTENT_REQUEST, or INSUFFICIENT_BALANCE leaving the
     * request pending
     */
    outcome::result<Fulfillment> fulfillRandomWords(RequestId request_id);

    /// Delivers the given words, or derived ones if `words` is empty
    outcome::result<Fulfillment> fulfillRandomWordsWithOverride(
        RequestId request_id, std::vector<RandomWord> words);

    bool isPending(RequestId request_id) const;

    /// sha256(be256(request_id) || be256(i)) for i in [0, num_words)
    static std::vector<RandomWord> deriveWords(RequestId request_id,
                                               uint32_t num_words);

   private:
    struct PendingRequest {
      SubscriptionId subscription_id = 0;
      uint32_t callback_gas_limit = 0;
      uint32_t num_words = 0;
      std::weak_ptr<RandomnessConsumer> consumer;
    };

    log::Logger logger_;
    const Config config_;

    mutable std::mutex mutex_;
    SubscriptionId last_subscription_id_ = 0;
    RequestId last_request_id_ = 0;
    std::map<SubscriptionId, Subscription> subscriptions_;
    std::map<RequestId, PendingRequest> requests_;
  };

}  // namespace raffle::randomness

OUTCOME_HPP_DECLARE_ERROR(raffle::randomness, VrfCoordinatorMock::Error);
