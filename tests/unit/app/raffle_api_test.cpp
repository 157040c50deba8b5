/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/raffle_api.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <qtils/test/outcome.hpp>
#include <rapidjson/document.h>

#include "metrics/handler.hpp"
#include "mock/app/configuration_mock.hpp"
#include "mock/randomness/randomness_provider_mock.hpp"
#include "payment/impl/in_memory_payment_rail.hpp"
#include "raffle/upkeep_coordinator.hpp"
#include "testutil/raffle_fixture.hpp"

using raffle::RaffleState;
using raffle::app::ConfigurationMock;
using raffle::app::RaffleApi;
using raffle::payment::InMemoryPaymentRail;
using raffle::randomness::RandomnessProviderMock;
using testutil::makeAddress;

using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::ReturnRef;

namespace bhttp = boost::beast::http;

class MetricsHandlerMock : public raffle::metrics::Handler {
 public:
  MOCK_METHOD(void,
              registerCollectable,
              (raffle::metrics::Registry &),
              (override));
  MOCK_METHOD(std::string, collect, (), (override));
};

class RaffleApiTest : public testutil::RaffleTestBase {
 public:
  void SetUp() override {
    RaffleTestBase::SetUp();
    app_config = std::make_shared<NiceMock<ConfigurationMock>>();
    ON_CALL(*app_config, nodeName()).WillByDefault(ReturnRef(node_name));
    ON_CALL(*app_config, metrics()).WillByDefault(ReturnRef(metrics_config));

    provider = std::make_shared<RandomnessProviderMock>();
    payment_rail = std::make_shared<InMemoryPaymentRail>(
        logsys, InMemoryPaymentRail::Config{});
    coordinator = std::make_shared<raffle::UpkeepCoordinator>(logsys,
                                                              ledger,
                                                              provider,
                                                              payment_rail,
                                                              steady_clock,
                                                              event_log,
                                                              metrics);
    metrics_handler = std::make_shared<MetricsHandlerMock>();
    api = std::make_shared<RaffleApi>(logsys,
                                      app_config,
                                      ledger,
                                      coordinator,
                                      event_log,
                                      payment_rail,
                                      metrics_handler);
  }

  raffle::http::Response get(std::string target) {
    raffle::http::Request request{bhttp::verb::get, target, 11};
    return api->handle(request);
  }

  raffle::http::Response post(std::string target, std::string body) {
    raffle::http::Request request{bhttp::verb::post, target, 11};
    request.body() = std::move(body);
    return api->handle(request);
  }

  static rapidjson::Document parse(const raffle::http::Response &response) {
    rapidjson::Document document;
    document.Parse(response.body().data(), response.body().size());
    EXPECT_FALSE(document.HasParseError()) << response.body();
    return document;
  }

  raffle::http::Response enter(const raffle::Address &participant,
                               std::string_view amount) {
    return post("/raffle/v0/enter",
                fmt::format(R"({{"participant":"{}","amount":"{}"}})",
                            raffle::toString(participant),
                            amount));
  }

  std::string node_name = "raffle-test";
  raffle::app::Configuration::MetricsConfig metrics_config{.enabled = true};

  std::shared_ptr<NiceMock<ConfigurationMock>> app_config;
  std::shared_ptr<RandomnessProviderMock> provider;
  std::shared_ptr<InMemoryPaymentRail> payment_rail;
  std::shared_ptr<raffle::UpkeepCoordinator> coordinator;
  std::shared_ptr<MetricsHandlerMock> metrics_handler;
  std::shared_ptr<RaffleApi> api;
};

/**
 * @given the api
 * @when health is queried
 * @then 200 with a JSON status is returned
 */
TEST_F(RaffleApiTest, Health) {
  auto response = get("/raffle/v0/health");
  EXPECT_EQ(response.result(), bhttp::status::ok);
  EXPECT_EQ(response[bhttp::field::content_type], "application/json");
  auto document = parse(response);
  EXPECT_STREQ(document["status"].GetString(), "healthy");
}

/**
 * @given a fresh raffle
 * @when its state is queried
 * @then the snapshot and the configuration are returned
 */
TEST_F(RaffleApiTest, State) {
  auto document = parse(get("/raffle/v0/state"));
  EXPECT_STREQ(document["name"].GetString(), "raffle-test");
  EXPECT_STREQ(document["state"].GetString(), "OPEN");
  EXPECT_EQ(document["entrants"].GetUint64(), 0u);
  EXPECT_STREQ(document["pooledBalance"].GetString(), "0");
  EXPECT_EQ(document["lastDrawTimestamp"].GetInt64(), kGenesis.count());
  EXPECT_TRUE(document["recentWinner"].IsNull());
  EXPECT_TRUE(document["pendingRequest"].IsNull());

  const auto &config = document["config"];
  EXPECT_STREQ(config["entranceFee"].GetString(), "100");
  EXPECT_EQ(config["interval"].GetInt64(), kInterval.count());
  EXPECT_EQ(config["requestConfirmations"].GetUint(), 3u);
  EXPECT_EQ(config["numWords"].GetUint(), 1u);
}

/**
 * @given a raffle with fee 100
 * @when valid and invalid entries are posted
 * @then valid ones are deposited, invalid ones get 400 with a reason
 */
TEST_F(RaffleApiTest, Enter) {
  auto response = enter(makeAddress(1), "100");
  ASSERT_EQ(response.result(), bhttp::status::ok) << response.body();
  EXPECT_EQ(parse(response)["entrants"].GetUint64(), 1u);

  response = enter(makeAddress(2), "0.000000000000000150 ether");
  ASSERT_EQ(response.result(), bhttp::status::ok) << response.body();
  EXPECT_EQ(ledger->pooledBalance(), 250);

  response = enter(makeAddress(3), "99");
  EXPECT_EQ(response.result(), bhttp::status::bad_request);
  EXPECT_TRUE(parse(response)["error"].IsString());

  EXPECT_EQ(post("/raffle/v0/enter", "not json").result(),
            bhttp::status::bad_request);
  EXPECT_EQ(post("/raffle/v0/enter", R"({"amount":"100"})").result(),
            bhttp::status::bad_request);
  EXPECT_EQ(post("/raffle/v0/enter",
                 R"({"participant":"0x1234","amount":"100"})")
                .result(),
            bhttp::status::bad_request);
  EXPECT_EQ(ledger->entrantCount(), 2u);
}

/**
 * @given two entrants
 * @when entrants are queried by index
 * @then existing ones are returned, others get 404 or 400
 */
TEST_F(RaffleApiTest, Entrants) {
  ASSERT_EQ(enter(makeAddress(1), "100").result(), bhttp::status::ok);
  ASSERT_EQ(enter(makeAddress(2), "100").result(), bhttp::status::ok);

  auto response = get("/raffle/v0/entrants/1");
  ASSERT_EQ(response.result(), bhttp::status::ok);
  EXPECT_EQ(parse(response)["entrant"].GetString(),
            raffle::toString(makeAddress(2)));

  EXPECT_EQ(get("/raffle/v0/entrants/2").result(), bhttp::status::not_found);
  EXPECT_EQ(get("/raffle/v0/entrants/x").result(), bhttp::status::bad_request);
}

/**
 * @given an entry made before the interval passed
 * @when upkeep is checked and performed, then again after the interval
 * @then the first attempt is a 409 with the snapshot, the second issues a
 * request
 */
TEST_F(RaffleApiTest, Upkeep) {
  ASSERT_EQ(enter(makeAddress(1), "100").result(), bhttp::status::ok);

  auto check = parse(get("/raffle/v0/upkeep"));
  EXPECT_FALSE(check["upkeepNeeded"].GetBool());
  EXPECT_FALSE(check["conditions"]["timePassed"].GetBool());
  EXPECT_TRUE(check["conditions"]["hasEntrants"].GetBool());

  auto rejected = post("/raffle/v0/upkeep", "");
  ASSERT_EQ(rejected.result(), bhttp::status::conflict);
  auto rejection = parse(rejected);
  EXPECT_STREQ(rejection["balance"].GetString(), "100");
  EXPECT_EQ(rejection["entrants"].GetUint64(), 1u);
  EXPECT_STREQ(rejection["state"].GetString(), "OPEN");

  passInterval();
  check = parse(get("/raffle/v0/upkeep"));
  ASSERT_TRUE(check["upkeepNeeded"].GetBool());
  std::string perform_data = check["performData"].GetString();
  EXPECT_EQ(perform_data, "0x0f");

  EXPECT_CALL(*provider, requestRandomWords(_, _)).WillOnce(Return(raffle::RequestId{9}));
  auto performed = post("/raffle/v0/upkeep",
                        fmt::format(R"({{"performData":"{}"}})", perform_data));
  ASSERT_EQ(performed.result(), bhttp::status::ok) << performed.body();
  EXPECT_EQ(parse(performed)["requestId"].GetUint64(), 9u);
  EXPECT_EQ(ledger->currentState(), RaffleState::CALCULATING);

  EXPECT_EQ(enter(makeAddress(2), "100").result(), bhttp::status::conflict);
  EXPECT_EQ(post("/raffle/v0/upkeep", R"({"performData":"zz"})").result(),
            bhttp::status::bad_request);
}

/**
 * @given a completed cycle
 * @when events and the winner balance are queried
 * @then the whole history and the credited prize are returned
 */
TEST_F(RaffleApiTest, EventsAndBalances) {
  auto alice = makeAddress(1);
  ASSERT_EQ(enter(alice, "100").result(), bhttp::status::ok);
  ASSERT_EQ(enter(makeAddress(2), "100").result(), bhttp::status::ok);
  passInterval();
  EXPECT_CALL(*provider, requestRandomWords(_, _)).WillOnce(Return(raffle::RequestId{1}));
  ASSERT_EQ(post("/raffle/v0/upkeep", "").result(), bhttp::status::ok);
  ASSERT_OUTCOME_SUCCESS(coordinator->fulfill(1, {raffle::RandomWord{4}}));

  auto all = parse(get("/raffle/v0/events"));
  const auto &events = all["events"];
  ASSERT_EQ(events.Size(), 4u);
  EXPECT_STREQ(events[0]["type"].GetString(), "Entered");
  EXPECT_EQ(events[0]["sequence"].GetUint64(), 1u);
  EXPECT_EQ(events[2]["requestId"].GetUint64(), 1u);
  EXPECT_STREQ(events[3]["type"].GetString(), "WinnerPicked");
  EXPECT_EQ(events[3]["winner"].GetString(), raffle::toString(alice));

  auto page = parse(get("/raffle/v0/events?since=1&limit=2"));
  ASSERT_EQ(page["events"].Size(), 2u);
  EXPECT_EQ(page["events"][0]["sequence"].GetUint64(), 2u);
  EXPECT_EQ(get("/raffle/v0/events?limit=0").result(),
            bhttp::status::bad_request);

  auto balance = parse(get("/raffle/v0/balances/" + raffle::toString(alice)));
  EXPECT_STREQ(balance["balance"].GetString(), "200");
  EXPECT_EQ(get("/raffle/v0/balances/0x12").result(),
            bhttp::status::bad_request);
}

/**
 * @given metrics enabled, then disabled
 * @when /metrics is scraped
 * @then the handler exposition is served only while enabled
 */
TEST_F(RaffleApiTest, Metrics) {
  EXPECT_CALL(*metrics_handler, collect())
      .WillOnce(Return("raffle_entrants 0\n"));
  auto response = get("/metrics");
  EXPECT_EQ(response.result(), bhttp::status::ok);
  EXPECT_EQ(response.body(), "raffle_entrants 0\n");

  metrics_config.enabled = false;
  EXPECT_EQ(get("/metrics").result(), bhttp::status::not_found);
}

/**
 * @given the api
 * @when unknown paths or wrong methods are used
 * @then 404 and 405 are returned
 */
TEST_F(RaffleApiTest, Routing) {
  EXPECT_EQ(get("/raffle/v0/unknown").result(), bhttp::status::not_found);
  EXPECT_EQ(get("/other").result(), bhttp::status::not_found);
  EXPECT_EQ(get("/raffle/v0/enter").result(),
            bhttp::status::method_not_allowed);
  EXPECT_EQ(post("/raffle/v0/state", "").result(),
            bhttp::status::method_not_allowed);
}
