/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include <qtils/outcome.hpp>

#include "raffle/types.hpp"

namespace raffle::randomness {

  /// Routing parameters of a randomness request
  struct RandomnessRequest {
    GasLane gas_lane;
    SubscriptionId subscription_id = 0;
    uint16_t request_confirmations = 0;
    uint32_t callback_gas_limit = 0;
    uint32_t num_words = 0;
  };

  /**
   * Receiver of delivered random words
   */
  class RandomnessConsumer {
   public:
    virtual ~RandomnessConsumer() = default;

    /**
     * Callback of the provider. Invoked at most once per request, on the
     * provider's own schedule.
     */
    virtual outcome::result<void> fulfillRandomWords(
        RequestId request_id, const std::vector<RandomWord> &random_words) = 0;
  };

  /**
   * External source of verifiable randomness
   */
  class RandomnessProvider {
   public:
    virtual ~RandomnessProvider() = default;

    /**
     * Registers a request and returns its id. The consumer is never called
     * before this method returns.
     */
    virtual outcome::result<RequestId> requestRandomWords(
        const RandomnessRequest &request,
        std::weak_ptr<RandomnessConsumer> consumer) = 0;
  };

}  // namespace raffle::randomness
