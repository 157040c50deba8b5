/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "randomness/impl/vrf_coordinator_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>

#include <qtils/test/outcome.hpp>

#include "crypto/sha/sha256.hpp"
#include "raffle/raffle_error.hpp"
#include "testutil/prepare_loggers.hpp"

using raffle::Amount;
using raffle::RandomWord;
using raffle::RequestId;
using raffle::randomness::RandomnessConsumer;
using raffle::randomness::RandomnessRequest;
using raffle::randomness::VrfCoordinatorMock;

using testing::_;
using testing::ElementsAre;
using testing::Return;

class RandomnessConsumerMock : public RandomnessConsumer {
 public:
  MOCK_METHOD(outcome::result<void>,
              fulfillRandomWords,
              (RequestId, const std::vector<RandomWord> &),
              (override));
};

class VrfCoordinatorMockTest : public testing::Test {
 public:
  // 0.25 LINK base fee, 1 gwei-link per gas
  static inline const Amount kBaseFee{"250000000000000000"};
  static inline const Amount kGasPrice{1'000'000'000};
  static constexpr uint32_t kGasLimit = 500'000;

  void SetUp() override {
    coordinator = std::make_shared<VrfCoordinatorMock>(
        testutil::prepareLoggers(),
        VrfCoordinatorMock::Config{.base_fee = kBaseFee,
                                   .gas_price_link = kGasPrice});
    consumer = std::make_shared<RandomnessConsumerMock>();
  }

  RandomnessRequest makeRequest(raffle::SubscriptionId subscription_id,
                                uint32_t num_words = 1) const {
    return RandomnessRequest{
        .subscription_id = subscription_id,
        .request_confirmations = 3,
        .callback_gas_limit = kGasLimit,
        .num_words = num_words,
    };
  }

  /// Price of one fulfillment with kGasLimit
  static Amount fulfillmentPrice() {
    return kBaseFee + kGasPrice * kGasLimit;
  }

  std::shared_ptr<VrfCoordinatorMock> coordinator;
  std::shared_ptr<RandomnessConsumerMock> consumer;
};

/**
 * @given a coordinator
 * @when subscriptions are created and funded
 * @then ids start from 1 and balances accumulate
 */
TEST_F(VrfCoordinatorMockTest, Subscriptions) {
  EXPECT_EQ(coordinator->createSubscription(), 1u);
  EXPECT_EQ(coordinator->createSubscription(), 2u);

  ASSERT_OUTCOME_SUCCESS(coordinator->fundSubscription(1, 100));
  ASSERT_OUTCOME_SUCCESS(coordinator->fundSubscription(1, 50));
  ASSERT_OUTCOME_SUCCESS(subscription, coordinator->getSubscription(1));
  EXPECT_EQ(subscription.balance, 150);
  EXPECT_EQ(subscription.request_count, 0u);

  ASSERT_OUTCOME_ERROR(coordinator->fundSubscription(3, 1),
                       VrfCoordinatorMock::Error::INVALID_SUBSCRIPTION);
  ASSERT_OUTCOME_ERROR(coordinator->getSubscription(0),
                       VrfCoordinatorMock::Error::INVALID_SUBSCRIPTION);
}

/**
 * @given one subscription
 * @when requests are made for it, for an unknown one, and with bad word counts
 * @then valid requests get increasing ids from 1, others are refused
 */
TEST_F(VrfCoordinatorMockTest, RequestRandomWords) {
  auto subscription_id = coordinator->createSubscription();

  ASSERT_OUTCOME_SUCCESS(
      first, coordinator->requestRandomWords(makeRequest(subscription_id),
                                             consumer));
  ASSERT_OUTCOME_SUCCESS(
      second, coordinator->requestRandomWords(makeRequest(subscription_id),
                                              consumer));
  EXPECT_EQ(first, 1u);
  EXPECT_EQ(second, 2u);
  EXPECT_TRUE(coordinator->isPending(first));
  EXPECT_EQ(coordinator->getSubscription(subscription_id)
                .value()
                .request_count,
            2u);

  ASSERT_OUTCOME_ERROR(
      coordinator->requestRandomWords(makeRequest(7), consumer),
      VrfCoordinatorMock::Error::INVALID_SUBSCRIPTION);
  ASSERT_OUTCOME_ERROR(
      coordinator->requestRandomWords(makeRequest(subscription_id, 0),
                                      consumer),
      VrfCoordinatorMock::Error::INVALID_NUM_WORDS);
  ASSERT_OUTCOME_ERROR(
      coordinator->requestRandomWords(
          makeRequest(subscription_id, VrfCoordinatorMock::kMaxNumWords + 1),
          consumer),
      VrfCoordinatorMock::Error::INVALID_NUM_WORDS);
}

/**
 * @given a request id and a word index
 * @when words are derived
 * @then each is sha256 of the big-endian 32-byte id followed by the index
 */
TEST_F(VrfCoordinatorMockTest, DeriveWords) {
  std::array<uint8_t, 64> preimage{};
  preimage[31] = 5;
  preimage[63] = 1;
  auto hash =
      raffle::crypto::sha256(qtils::ByteView{preimage.data(), preimage.size()});
  RandomWord expected;
  boost::multiprecision::import_bits(expected, hash.begin(), hash.end());

  auto words = VrfCoordinatorMock::deriveWords(5, 2);
  ASSERT_EQ(words.size(), 2u);
  EXPECT_EQ(words[1], expected);
  EXPECT_NE(words[0], words[1]);
  EXPECT_EQ(VrfCoordinatorMock::deriveWords(5, 2), words);
}

/**
 * @given a funded subscription with a pending request
 * @when the request is fulfilled
 * @then the consumer gets the derived words, the subscription pays
 * base fee plus gas and the request is gone
 */
TEST_F(VrfCoordinatorMockTest, Fulfill) {
  auto subscription_id = coordinator->createSubscription();
  ASSERT_OUTCOME_SUCCESS(
      coordinator->fundSubscription(subscription_id, fulfillmentPrice() * 2));
  ASSERT_OUTCOME_SUCCESS(
      request_id, coordinator->requestRandomWords(makeRequest(subscription_id),
                                                  consumer));

  auto expected_words = VrfCoordinatorMock::deriveWords(request_id, 1);
  EXPECT_CALL(*consumer, fulfillRandomWords(request_id, expected_words))
      .WillOnce(Return(outcome::success()));

  ASSERT_OUTCOME_SUCCESS(fulfillment,
                         coordinator->fulfillRandomWords(request_id));
  EXPECT_EQ(fulfillment.request_id, request_id);
  EXPECT_EQ(fulfillment.payment, fulfillmentPrice());
  EXPECT_TRUE(fulfillment.success);
  EXPECT_FALSE(coordinator->isPending(request_id));
  EXPECT_EQ(coordinator->getSubscription(subscription_id).value().balance,
            fulfillmentPrice());

  ASSERT_OUTCOME_ERROR(coordinator->fulfillRandomWords(request_id),
                       VrfCoordinatorMock::Error::NONEXISTENT_REQUEST);
}

/**
 * @given a subscription that cannot cover a fulfillment
 * @when the request is fulfilled, then the subscription is topped up
 * @then the first attempt fails and keeps the request pending
 */
TEST_F(VrfCoordinatorMockTest, InsufficientBalance) {
  auto subscription_id = coordinator->createSubscription();
  ASSERT_OUTCOME_SUCCESS(coordinator->fundSubscription(subscription_id, 1));
  ASSERT_OUTCOME_SUCCESS(
      request_id, coordinator->requestRandomWords(makeRequest(subscription_id),
                                                  consumer));

  EXPECT_CALL(*consumer, fulfillRandomWords(_, _)).Times(0);
  ASSERT_OUTCOME_ERROR(coordinator->fulfillRandomWords(request_id),
                       VrfCoordinatorMock::Error::INSUFFICIENT_BALANCE);
  EXPECT_TRUE(coordinator->isPending(request_id));
  testing::Mock::VerifyAndClearExpectations(consumer.get());

  ASSERT_OUTCOME_SUCCESS(
      coordinator->fundSubscription(subscription_id, fulfillmentPrice()));
  EXPECT_CALL(*consumer, fulfillRandomWords(request_id, _))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS(coordinator->fulfillRandomWords(request_id));
}

/**
 * @given a pending request
 * @when the consumer rejects the words
 * @then the fulfillment reports failure and the request is consumed anyway
 */
TEST_F(VrfCoordinatorMockTest, ConsumerRejects) {
  auto subscription_id = coordinator->createSubscription();
  ASSERT_OUTCOME_SUCCESS(
      coordinator->fundSubscription(subscription_id, fulfillmentPrice()));
  ASSERT_OUTCOME_SUCCESS(
      request_id, coordinator->requestRandomWords(makeRequest(subscription_id),
                                                  consumer));

  EXPECT_CALL(*consumer, fulfillRandomWords(request_id, _))
      .WillOnce(Return(raffle::RaffleError::NOT_CALCULATING));

  ASSERT_OUTCOME_SUCCESS(fulfillment,
                         coordinator->fulfillRandomWords(request_id));
  EXPECT_FALSE(fulfillment.success);
  EXPECT_FALSE(coordinator->isPending(request_id));
}

/**
 * @given a pending request for one word
 * @when it is fulfilled with explicit words
 * @then those words are delivered, a wrong count is refused
 */
TEST_F(VrfCoordinatorMockTest, FulfillWithOverride) {
  auto subscription_id = coordinator->createSubscription();
  ASSERT_OUTCOME_SUCCESS(
      coordinator->fundSubscription(subscription_id, fulfillmentPrice()));
  ASSERT_OUTCOME_SUCCESS(
      request_id, coordinator->requestRandomWords(makeRequest(subscription_id),
                                                  consumer));

  ASSERT_OUTCOME_ERROR(
      coordinator->fulfillRandomWordsWithOverride(
          request_id, {RandomWord{1}, RandomWord{2}}),
      VrfCoordinatorMock::Error::WORD_COUNT_MISMATCH);

  EXPECT_CALL(*consumer,
              fulfillRandomWords(request_id, ElementsAre(RandomWord{7})))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS(fulfillment,
                         coordinator->fulfillRandomWordsWithOverride(
                             request_id, {RandomWord{7}}));
  EXPECT_TRUE(fulfillment.success);
}

/**
 * @given a pending request whose consumer is destroyed
 * @when it is fulfilled
 * @then the subscription is charged and the fulfillment reports failure
 */
TEST_F(VrfCoordinatorMockTest, ConsumerGone) {
  auto subscription_id = coordinator->createSubscription();
  ASSERT_OUTCOME_SUCCESS(
      coordinator->fundSubscription(subscription_id, fulfillmentPrice()));
  ASSERT_OUTCOME_SUCCESS(
      request_id, coordinator->requestRandomWords(makeRequest(subscription_id),
                                                  consumer));
  consumer.reset();

  ASSERT_OUTCOME_SUCCESS(fulfillment,
                         coordinator->fulfillRandomWords(request_id));
  EXPECT_FALSE(fulfillment.success);
  EXPECT_EQ(coordinator->getSubscription(subscription_id).value().balance, 0);
}
