/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/upkeep_keeper.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

#include <qtils/test/outcome.hpp>

#include "mock/app/configuration_mock.hpp"
#include "mock/app/state_manager_mock.hpp"
#include "mock/payment/payment_rail_mock.hpp"
#include "mock/randomness/randomness_provider_mock.hpp"
#include "raffle/upkeep_coordinator.hpp"
#include "testutil/raffle_fixture.hpp"

using raffle::RaffleState;
using raffle::RequestId;
using raffle::app::Configuration;
using raffle::app::ConfigurationMock;
using raffle::app::StateManagerMock;
using raffle::app::UpkeepKeeper;
using raffle::payment::PaymentRailMock;
using raffle::randomness::RandomnessProviderMock;
using testutil::makeAddress;

using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::ReturnRef;

class UpkeepKeeperTest : public testutil::RaffleTestBase {
 public:
  void SetUp() override {
    RaffleTestBase::SetUp();
    state_manager = std::make_shared<NiceMock<StateManagerMock>>();
    app_config = std::make_shared<NiceMock<ConfigurationMock>>();
    ON_CALL(*app_config, keeper()).WillByDefault(ReturnRef(keeper_config));

    provider = std::make_shared<RandomnessProviderMock>();
    coordinator = std::make_shared<raffle::UpkeepCoordinator>(
        logsys,
        ledger,
        provider,
        std::make_shared<PaymentRailMock>(),
        steady_clock,
        event_log,
        metrics);
  }

  std::shared_ptr<UpkeepKeeper> makeKeeper() {
    return std::make_shared<UpkeepKeeper>(
        logsys, state_manager, app_config, coordinator);
  }

  void enterAndPassInterval() {
    ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(1), 100));
    passInterval();
  }

  Configuration::KeeperConfig keeper_config{
      .enabled = true, .period = std::chrono::milliseconds{10}};

  std::shared_ptr<NiceMock<StateManagerMock>> state_manager;
  std::shared_ptr<NiceMock<ConfigurationMock>> app_config;
  std::shared_ptr<RandomnessProviderMock> provider;
  std::shared_ptr<raffle::UpkeepCoordinator> coordinator;
};

/**
 * @given a keeper
 * @when it is created
 * @then it registers its start and stop with the state manager
 */
TEST_F(UpkeepKeeperTest, TakesControl) {
  EXPECT_CALL(*state_manager, atLaunch(_));
  EXPECT_CALL(*state_manager, atShutdown(_));
  EXPECT_CALL(*state_manager, atPrepare(_)).Times(0);
  auto keeper = makeKeeper();
}

/**
 * @given a raffle that is not due
 * @when an upkeep round runs
 * @then no draw is requested
 */
TEST_F(UpkeepKeeperTest, NothingToDo) {
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(1), 100));
  EXPECT_CALL(*provider, requestRandomWords(_, _)).Times(0);

  auto keeper = makeKeeper();
  EXPECT_EQ(keeper->checkUpkeep(), std::nullopt);
  EXPECT_EQ(ledger->currentState(), RaffleState::OPEN);
}

/**
 * @given a due raffle
 * @when an upkeep round runs twice
 * @then the first one requests a draw, the second one finds it in flight
 */
TEST_F(UpkeepKeeperTest, RequestsDrawWhenDue) {
  enterAndPassInterval();
  EXPECT_CALL(*provider, requestRandomWords(_, _))
      .WillOnce(Return(RequestId{3}));

  auto keeper = makeKeeper();
  EXPECT_EQ(keeper->checkUpkeep(), std::optional<RequestId>{3});
  EXPECT_EQ(keeper->checkUpkeep(), std::nullopt);
  EXPECT_EQ(ledger->currentState(), RaffleState::CALCULATING);
}

/**
 * @given a due raffle and a started keeper
 * @when its timer fires
 * @then the draw is requested without any explicit call
 */
TEST_F(UpkeepKeeperTest, TimerDrivesUpkeep) {
  enterAndPassInterval();
  EXPECT_CALL(*provider, requestRandomWords(_, _))
      .WillOnce(Return(RequestId{1}));

  auto keeper = makeKeeper();
  ASSERT_TRUE(keeper->start());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (ledger->currentState() != RaffleState::CALCULATING
         and std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  keeper->stop();

  EXPECT_EQ(ledger->currentState(), RaffleState::CALCULATING);
}

/**
 * @given a disabled keeper
 * @when it is started
 * @then it reports success and never triggers a draw
 */
TEST_F(UpkeepKeeperTest, Disabled) {
  keeper_config.enabled = false;
  enterAndPassInterval();
  EXPECT_CALL(*provider, requestRandomWords(_, _)).Times(0);

  auto keeper = makeKeeper();
  ASSERT_TRUE(keeper->start());
  std::this_thread::sleep_for(std::chrono::milliseconds{50});
  keeper->stop();

  EXPECT_EQ(ledger->currentState(), RaffleState::OPEN);
}
