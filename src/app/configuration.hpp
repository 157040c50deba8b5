/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include "raffle/raffle_config.hpp"

namespace raffle::app {

  class Configuration {
   public:
    using Endpoint = boost::asio::ip::tcp::endpoint;

    struct KeeperConfig {
      bool enabled = true;
      std::chrono::milliseconds period{std::chrono::seconds{1}};
    };

    struct OracleConfig {
      Amount base_fee;
      Amount gas_price_link;
      std::chrono::milliseconds fulfillment_delay{std::chrono::seconds{2}};
      Amount subscription_fund;
    };

    struct PaymentConfig {
      std::vector<Address> rejected_recipients;
    };

    struct ApiConfig {
      Endpoint endpoint;
    };

    struct MetricsConfig {
      std::optional<bool> enabled;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual const RaffleConfig &raffle() const;
    [[nodiscard]] virtual const KeeperConfig &keeper() const;
    [[nodiscard]] virtual const OracleConfig &oracle() const;
    [[nodiscard]] virtual const PaymentConfig &payment() const;
    [[nodiscard]] virtual const ApiConfig &api() const;
    [[nodiscard]] virtual const MetricsConfig &metrics() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;

    RaffleConfig raffle_;
    KeeperConfig keeper_;
    OracleConfig oracle_;
    PaymentConfig payment_;
    ApiConfig api_;
    MetricsConfig metrics_;
  };

}  // namespace raffle::app
