/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/parsers.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using raffle::Amount;
using raffle::util::parseAddress;
using raffle::util::parseAmount;
using raffle::util::parseDuration;

TEST(ParseDurationTest, Units) {
  EXPECT_EQ(parseDuration("30"), std::optional{30000ms});
  EXPECT_EQ(parseDuration("500ms"), std::optional{500ms});
  EXPECT_EQ(parseDuration("30s"), std::optional{30000ms});
  EXPECT_EQ(parseDuration(" 2 min "), std::optional{120000ms});
  EXPECT_EQ(parseDuration("1H"), std::optional{3600000ms});
  EXPECT_EQ(parseDuration("1 day"), std::optional{86400000ms});
}

TEST(ParseDurationTest, Invalid) {
  EXPECT_EQ(parseDuration(""), std::nullopt);
  EXPECT_EQ(parseDuration("s"), std::nullopt);
  EXPECT_EQ(parseDuration("-5s"), std::nullopt);
  EXPECT_EQ(parseDuration("5 fortnights"), std::nullopt);
  EXPECT_EQ(parseDuration("99999999999999999999"), std::nullopt);
  EXPECT_EQ(parseDuration("18446744073709551615 days"), std::nullopt);
}

TEST(ParseAmountTest, Units) {
  EXPECT_EQ(parseAmount("100"), Amount{100});
  EXPECT_EQ(parseAmount("100 wei"), Amount{100});
  EXPECT_EQ(parseAmount("5 gwei"), Amount{5'000'000'000});
  EXPECT_EQ(parseAmount("0.01 ether"), Amount{10'000'000'000'000'000});
  EXPECT_EQ(parseAmount("0.25 LINK"), Amount{250'000'000'000'000'000});
  EXPECT_EQ(parseAmount("1.5eth"), Amount{1'500'000'000'000'000'000});
  EXPECT_EQ(parseAmount("0"), Amount{0});
}

TEST(ParseAmountTest, Invalid) {
  EXPECT_EQ(parseAmount(""), std::nullopt);
  EXPECT_EQ(parseAmount("ether"), std::nullopt);
  EXPECT_EQ(parseAmount("1.5"), std::nullopt);
  EXPECT_EQ(parseAmount("0.0000000001 gwei"), std::nullopt);
  EXPECT_EQ(parseAmount("1.2.3 ether"), std::nullopt);
  EXPECT_EQ(parseAmount("10 btc"), std::nullopt);
}

TEST(ParseAmountTest, Bounds) {
  auto max = std::numeric_limits<Amount>::max();
  EXPECT_EQ(parseAmount(max.str()), max);
  EXPECT_EQ(parseAmount((boost::multiprecision::cpp_int{max} + 1).str()),
            std::nullopt);
  EXPECT_EQ(parseAmount(std::string(100, '9')), std::nullopt);
}

TEST(ParseAddressTest, Address) {
  auto address =
      parseAddress("0x00000000000000000000000000000000000000Ff");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->back(), 0xff);
  EXPECT_EQ(address->front(), 0);

  EXPECT_EQ(parseAddress("0x1234"), std::nullopt);
  EXPECT_EQ(parseAddress("000000000000000000000000000000000000000000"),
            std::nullopt);
  EXPECT_EQ(parseAddress("0x00000000000000000000000000000000000000zz"),
            std::nullopt);
}
