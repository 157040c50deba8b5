/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace raffle::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        api_{
            .endpoint{boost::asio::ip::address_v4::loopback(), 9650},
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const RaffleConfig &Configuration::raffle() const {
    return raffle_;
  }

  const Configuration::KeeperConfig &Configuration::keeper() const {
    return keeper_;
  }

  const Configuration::OracleConfig &Configuration::oracle() const {
    return oracle_;
  }

  const Configuration::PaymentConfig &Configuration::payment() const {
    return payment_;
  }

  const Configuration::ApiConfig &Configuration::api() const {
    return api_;
  }

  const Configuration::MetricsConfig &Configuration::metrics() const {
    return metrics_;
  }

}  // namespace raffle::app
