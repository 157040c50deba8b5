/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle_ledger.hpp"

#include <gtest/gtest.h>

#include <limits>

#include <qtils/test/outcome.hpp>

#include "testutil/raffle_fixture.hpp"

using raffle::EnteredEvent;
using raffle::RaffleError;
using raffle::RaffleState;
using testutil::makeAddress;

class RaffleLedgerTest : public testutil::RaffleTestBase {};

/**
 * @given a fresh raffle
 * @when nothing was deposited yet
 * @then it is open, empty, without a winner and stamped at creation time
 */
TEST_F(RaffleLedgerTest, FreshRaffle) {
  EXPECT_EQ(ledger->currentState(), RaffleState::OPEN);
  EXPECT_EQ(ledger->entrantCount(), 0u);
  EXPECT_EQ(ledger->pooledBalance(), 0);
  EXPECT_FALSE(ledger->mostRecentWinner().has_value());
  EXPECT_EQ(ledger->lastDrawTimestamp(), kGenesis);
  EXPECT_EQ(ledger->entranceFee(), 100);
  EXPECT_EQ(ledger->interval(), kInterval);
  EXPECT_EQ(ledger->requestConfirmations(), 3u);
  EXPECT_EQ(ledger->numWords(), 1u);
  EXPECT_EQ(metrics->raffle_state_.value, 0);
}

/**
 * @given a raffle with entrance fee 100
 * @when a participant deposits exactly the fee
 * @then the participant is the last entrant, the balance grows by the deposit
 * and Entered is emitted
 */
TEST_F(RaffleLedgerTest, DepositAtFee) {
  auto alice = makeAddress(1);

  ASSERT_OUTCOME_SUCCESS(ledger->deposit(alice, 100));

  EXPECT_EQ(ledger->entrantCount(), 1u);
  EXPECT_EQ(ledger->pooledBalance(), 100);
  ASSERT_OUTCOME_SUCCESS(entrant, ledger->entrantAt(0));
  EXPECT_EQ(entrant, alice);

  auto events = event_log->since(0, 10);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].sequence, 1u);
  EXPECT_EQ(events[0].timestamp, kGenesis);
  EXPECT_EQ(std::get<EnteredEvent>(events[0].event).participant, alice);

  EXPECT_EQ(metrics->raffle_entries_total_.value, 1);
  EXPECT_EQ(metrics->raffle_entrants_.value, 1);
  EXPECT_EQ(metrics->raffle_pooled_balance_.value, 100);
}

/**
 * @given a raffle with entrance fee 100
 * @when a participant overpays
 * @then the whole amount is pooled
 */
TEST_F(RaffleLedgerTest, OverpaymentIsPooled) {
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(1), 250));
  EXPECT_EQ(ledger->pooledBalance(), 250);
}

/**
 * @given a raffle with entrance fee 100
 * @when a participant deposits less than the fee
 * @then INSUFFICIENT_STAKE is returned and nothing changes
 */
TEST_F(RaffleLedgerTest, DepositBelowFee) {
  ASSERT_OUTCOME_ERROR(ledger->deposit(makeAddress(1), 99),
                       RaffleError::INSUFFICIENT_STAKE);
  ASSERT_OUTCOME_ERROR(ledger->deposit(makeAddress(1), 0),
                       RaffleError::INSUFFICIENT_STAKE);

  EXPECT_EQ(ledger->entrantCount(), 0u);
  EXPECT_EQ(ledger->pooledBalance(), 0);
  EXPECT_EQ(event_log->size(), 0u);
  EXPECT_EQ(metrics->raffle_rejected_entries_total_.value, 2);
}

/**
 * @given a pool already holding the largest representable amount
 * @when another fee-sized deposit arrives
 * @then BALANCE_OVERFLOW is returned and the pool keeps its balance and
 * entrants
 */
TEST_F(RaffleLedgerTest, DepositOverflowingPool) {
  const auto max = std::numeric_limits<raffle::Amount>::max();
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(1), max));

  ASSERT_OUTCOME_ERROR(ledger->deposit(makeAddress(2), 100),
                       RaffleError::BALANCE_OVERFLOW);

  EXPECT_EQ(ledger->pooledBalance(), max);
  EXPECT_EQ(ledger->entrantCount(), 1u);
  EXPECT_EQ(event_log->size(), 1u);
  EXPECT_EQ(metrics->raffle_rejected_entries_total_.value, 1);
}

/**
 * @given a participant that already entered
 * @when it deposits again
 * @then it holds two entries in insertion order
 */
TEST_F(RaffleLedgerTest, RepeatEntries) {
  auto alice = makeAddress(1);
  auto bob = makeAddress(2);

  ASSERT_OUTCOME_SUCCESS(ledger->deposit(alice, 100));
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(bob, 100));
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(alice, 100));

  EXPECT_EQ(ledger->entrantCount(), 3u);
  EXPECT_EQ(ledger->pooledBalance(), 300);
  EXPECT_EQ(ledger->entrantAt(0).value(), alice);
  EXPECT_EQ(ledger->entrantAt(1).value(), bob);
  EXPECT_EQ(ledger->entrantAt(2).value(), alice);
  EXPECT_EQ(event_log->size(), 3u);
}

/**
 * @given two entrants
 * @when an index past the end is queried
 * @then INDEX_OUT_OF_RANGE is returned
 */
TEST_F(RaffleLedgerTest, EntrantAtOutOfRange) {
  ASSERT_OUTCOME_ERROR(ledger->entrantAt(0), RaffleError::INDEX_OUT_OF_RANGE);

  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(1), 100));
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(2), 100));

  ASSERT_OUTCOME_SUCCESS(ledger->entrantAt(1));
  ASSERT_OUTCOME_ERROR(ledger->entrantAt(2), RaffleError::INDEX_OUT_OF_RANGE);
  ASSERT_OUTCOME_ERROR(ledger->entrantAt(100),
                       RaffleError::INDEX_OUT_OF_RANGE);
}

/**
 * @given deposits into a raffle
 * @when a snapshot is taken
 * @then it carries every field of the cycle
 */
TEST_F(RaffleLedgerTest, Snapshot) {
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(1), 100));
  ASSERT_OUTCOME_SUCCESS(ledger->deposit(makeAddress(2), 150));

  auto snapshot = ledger->snapshot();
  EXPECT_EQ(snapshot.state, RaffleState::OPEN);
  EXPECT_EQ(snapshot.entrant_count, 2u);
  EXPECT_EQ(snapshot.pooled_balance, 250);
  EXPECT_EQ(snapshot.last_draw_timestamp, kGenesis);
  EXPECT_FALSE(snapshot.recent_winner.has_value());
  EXPECT_FALSE(snapshot.pending_request.has_value());
}
