/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>

#include <fmt/format.h>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "testutil/prepare_loggers.hpp"

using raffle::Amount;
using raffle::app::Configurator;

class ConfiguratorTest : public testing::Test {
 public:
  void SetUp() override {
    base_path = std::filesystem::temp_directory_path()
              / fmt::format("raffle_configurator_test_{}", getpid());
    std::filesystem::create_directories(base_path);
  }

  void TearDown() override {
    std::filesystem::current_path(std::filesystem::temp_directory_path());
    std::filesystem::remove_all(base_path);
  }

  std::string writeConfig(std::string_view yaml) {
    auto path = base_path / "config.yaml";
    std::ofstream{path} << yaml;
    return path.string();
  }

  /// Runs both parse steps and builds the configuration
  outcome::result<std::shared_ptr<raffle::app::Configuration>> configure(
      std::vector<std::string> args) {
    args.insert(args.begin(), "raffle_node");
    args.emplace_back("--base-path");
    args.emplace_back(base_path.string());
    std::vector<const char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    Configurator configurator{
        static_cast<int>(args.size()), argv.data(), nullptr};
    OUTCOME_TRY(done, configurator.step1());
    EXPECT_FALSE(done);
    OUTCOME_TRY(done2, configurator.step2());
    EXPECT_FALSE(done2);
    return configurator.calculateConfig(logger);
  }

  std::filesystem::path base_path;
  raffle::log::Logger logger =
      testutil::prepareLoggers()->getLogger("Configurator", "testing");
};

/**
 * @given no config file and no options
 * @when the configuration is calculated
 * @then development network defaults are used
 */
TEST_F(ConfiguratorTest, Defaults) {
  ASSERT_OUTCOME_SUCCESS(config, configure({}));

  const auto &raffle = config->raffle();
  EXPECT_EQ(raffle.entrance_fee, Amount{10'000'000'000'000'000});
  EXPECT_EQ(raffle.interval, std::chrono::seconds{30});
  EXPECT_EQ(raffle.subscription_id, 1u);
  EXPECT_EQ(raffle.request_confirmations, 3u);
  EXPECT_EQ(raffle.callback_gas_limit, 500'000u);
  EXPECT_EQ(raffle.gas_lane.front(), 0x47);
  EXPECT_EQ(raffle.gas_lane.back(), 0x6c);

  EXPECT_TRUE(config->keeper().enabled);
  EXPECT_EQ(config->oracle().base_fee, Amount{250'000'000'000'000'000});
  EXPECT_EQ(config->api().endpoint.port(), 9650);
  EXPECT_EQ(config->metrics().enabled, std::optional<bool>{true});
  EXPECT_TRUE(config->payment().rejected_recipients.empty());
}

/**
 * @given a config file and CLI options for the same values
 * @when the configuration is calculated
 * @then file values apply and CLI options override them
 */
TEST_F(ConfiguratorTest, FileAndOverrides) {
  auto path = writeConfig(R"(
general:
  name: raffle-one
raffle:
  entrance-fee: 5 gwei
  interval: 2m
  subscription-id: 7
  callback-gas-limit: 100000
keeper:
  enabled: true
  period: 250ms
oracle:
  fulfillment-delay: 1s
payment:
  rejected-recipients:
    - "0x00000000000000000000000000000000000000ff"
api:
  host: 0.0.0.0
  port: 8080
metrics:
  enabled: false
)");

  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"--config",
                                    path,
                                    "--interval",
                                    "45s",
                                    "--keeper-disable",
                                    "--api-port",
                                    "9000"}));

  EXPECT_EQ(config->nodeName(), "raffle-one");
  EXPECT_EQ(config->raffle().entrance_fee, Amount{5'000'000'000});
  EXPECT_EQ(config->raffle().interval, std::chrono::seconds{45});
  EXPECT_EQ(config->raffle().subscription_id, 7u);
  EXPECT_EQ(config->raffle().callback_gas_limit, 100'000u);
  EXPECT_FALSE(config->keeper().enabled);
  EXPECT_EQ(config->keeper().period, std::chrono::milliseconds{250});
  EXPECT_EQ(config->oracle().fulfillment_delay, std::chrono::seconds{1});
  ASSERT_EQ(config->payment().rejected_recipients.size(), 1u);
  EXPECT_EQ(config->payment().rejected_recipients[0].back(), 0xff);
  EXPECT_EQ(config->api().endpoint.address().to_string(), "0.0.0.0");
  EXPECT_EQ(config->api().endpoint.port(), 9000);
  EXPECT_EQ(config->metrics().enabled, std::optional<bool>{false});
}

/**
 * @given a config file with malformed values
 * @when the configuration is calculated
 * @then it fails as a config file error
 */
TEST_F(ConfiguratorTest, InvalidFileValue) {
  auto path = writeConfig(R"(
raffle:
  entrance-fee: lots
)");
  ASSERT_OUTCOME_ERROR(configure({"--config", path}),
                       Configurator::Error::ConfigFileParseFailed);
}

/**
 * @given CLI options with unacceptable values
 * @when the configuration is calculated
 * @then it fails
 */
TEST_F(ConfiguratorTest, InvalidCliValues) {
  ASSERT_OUTCOME_ERROR(configure({"--interval", "soon"}),
                       Configurator::Error::CliArgsParseFailed);
  ASSERT_OUTCOME_ERROR(configure({"--entrance-fee", "0"}),
                       Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(configure({"--unknown-option"}),
                       Configurator::Error::CliArgsParseFailed);
}
