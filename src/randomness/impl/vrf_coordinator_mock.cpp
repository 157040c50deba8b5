/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "randomness/impl/vrf_coordinator_mock.hpp"

#include <array>

#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(raffle::randomness, VrfCoordinatorMock::Error, e) {
  using E = raffle::randomness::VrfCoordinatorMock::Error;
  switch (e) {
    case E::INVALID_SUBSCRIPTION:
      return "Invalid subscription";
    case E::INVALID_NUM_WORDS:
      return "Number of random words out of range";
    case E::NONEXISTENT_REQUEST:
      return "Nonexistent request";
    case E::INSUFFICIENT_BALANCE:
      return "Insufficient subscription balance";
    case E::WORD_COUNT_MISMATCH:
      return "Number of words differs from the requested one";
  }
  return "Unknown randomness error";
}

namespace raffle::randomness {

  namespace {
    void putBigEndian(uint64_t value, uint8_t *slot_end) {
      for (size_t i = 0; i < sizeof(value); ++i) {
        *--slot_end = static_cast<uint8_t>(value >> (8 * i));
      }
    }
  }  // namespace

  VrfCoordinatorMock::VrfCoordinatorMock(
      qtils::SharedRef<log::LoggingSystem> logsys, Config config)
      : logger_{logsys->getLogger("VrfCoordinator", "randomness")},
        config_{std::move(config)} {}

  outcome::result<RequestId> VrfCoordinatorMock::requestRandomWords(
      const RandomnessRequest &request,
      std::weak_ptr<RandomnessConsumer> consumer) {
    std::lock_guard lock{mutex_};
    auto it = subscriptions_.find(request.subscription_id);
    if (it == subscriptions_.end()) {
      return Error::INVALID_SUBSCRIPTION;
    }
    if (request.num_words == 0 or request.num_words > kMaxNumWords) {
      return Error::INVALID_NUM_WORDS;
    }

    auto request_id = ++last_request_id_;
    ++it->second.request_count;
    requests_.emplace(request_id,
                      PendingRequest{
                          .subscription_id = request.subscription_id,
                          .callback_gas_limit = request.callback_gas_limit,
                          .num_words = request.num_words,
                          .consumer = std::move(consumer),
                      });
    SL_DEBUG(logger_,
             "Random words requested: request #{}, subscription {}, "
             "{} confirmations, gas limit {}, {} words",
             request_id,
             request.subscription_id,
             request.request_confirmations,
             request.callback_gas_limit,
             request.num_words);
    return request_id;
  }

  SubscriptionId VrfCoordinatorMock::createSubscription() {
    std::lock_guard lock{mutex_};
    auto subscription_id = ++last_subscription_id_;
    subscriptions_.emplace(subscription_id, Subscription{});
    SL_INFO(logger_, "Subscription {} created", subscription_id);
    return subscription_id;
  }

  outcome::result<void> VrfCoordinatorMock::fundSubscription(
      SubscriptionId subscription_id, const Amount &amount) {
    std::lock_guard lock{mutex_};
    auto it = subscriptions_.find(subscription_id);
    if (it == subscriptions_.end()) {
      return Error::INVALID_SUBSCRIPTION;
    }
    it->second.balance += amount;
    SL_INFO(logger_,
            "Subscription {} funded with {}, balance {}",
            subscription_id,
            amount,
            it->second.balance);
    return outcome::success();
  }

  outcome::result<VrfCoordinatorMock::Subscription>
  VrfCoordinatorMock::getSubscription(SubscriptionId subscription_id) const {
    std::lock_guard lock{mutex_};
    auto it = subscriptions_.find(subscription_id);
    if (it == subscriptions_.end()) {
      return Error::INVALID_SUBSCRIPTION;
    }
    return it->second;
  }

  outcome::result<VrfCoordinatorMock::Fulfillment>
  VrfCoordinatorMock::fulfillRandomWords(RequestId request_id) {
    return fulfillRandomWordsWithOverride(request_id, {});
  }

  outcome::result<VrfCoordinatorMock::Fulfillment>
  VrfCoordinatorMock::fulfillRandomWordsWithOverride(
      RequestId request_id, std::vector<RandomWord> words) {
    PendingRequest request;
    Amount payment;
    {
      std::lock_guard lock{mutex_};
      auto it = requests_.find(request_id);
      if (it == requests_.end()) {
        return Error::NONEXISTENT_REQUEST;
      }
      if (words.empty()) {
        words = deriveWords(request_id, it->second.num_words);
      } else if (words.size() != it->second.num_words) {
        return Error::WORD_COUNT_MISMATCH;
      }
      auto &subscription = subscriptions_[it->second.subscription_id];
      payment = config_.base_fee
              + config_.gas_price_link * it->second.callback_gas_limit;
      if (subscription.balance < payment) {
        SL_WARN(logger_,
                "Request #{} not fulfilled: subscription {} has {}, needs {}",
                request_id,
                it->second.subscription_id,
                subscription.balance,
                payment);
        return Error::INSUFFICIENT_BALANCE;
      }
      subscription.balance -= payment;
      request = std::move(it->second);
      requests_.erase(it);
    }

    // consumer takes its own lock, never call it under ours
    bool success = false;
    if (auto consumer = request.consumer.lock()) {
      auto res = consumer->fulfillRandomWords(request_id, words);
      success = res.has_value();
      if (not success) {
        SL_WARN(logger_,
                "Consumer rejected words of request #{}: {}",
                request_id,
                res.error());
      }
    } else {
      SL_WARN(logger_, "Consumer of request #{} is gone", request_id);
    }

    SL_DEBUG(logger_,
             "Request #{} fulfilled, payment {}, success {}",
             request_id,
             payment,
             success);
    return Fulfillment{
        .request_id = request_id,
        .payment = payment,
        .success = success,
    };
  }

  bool VrfCoordinatorMock::isPending(RequestId request_id) const {
    std::lock_guard lock{mutex_};
    return requests_.contains(request_id);
  }

  std::vector<RandomWord> VrfCoordinatorMock::deriveWords(RequestId request_id,
                                                          uint32_t num_words) {
    std::vector<RandomWord> words;
    words.reserve(num_words);
    std::array<uint8_t, 64> preimage{};
    putBigEndian(request_id, preimage.data() + 32);
    for (uint32_t i = 0; i < num_words; ++i) {
      putBigEndian(i, preimage.data() + 64);
      auto hash = crypto::sha256(
          qtils::ByteView{preimage.data(), preimage.size()});
      RandomWord word;
      boost::multiprecision::import_bits(word, hash.begin(), hash.end());
      words.emplace_back(std::move(word));
    }
    return words;
  }

}  // namespace raffle::randomness
