/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(raffle::log, Error, e) {
  using E = raffle::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_FILTER:
      return "Malformed logging filter, expected <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace raffle::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    outcome::result<void> result = outcome::success();
    auto fail = [&](Error error) {
      if (result.has_value()) {
        result = error;
      }
    };

    for (std::string_view filter : filters) {
      if (auto level = str2lvl(filter); level.has_value()) {
        logging_system_->setLevelOfGroup(defaultGroupName, level.value());
        continue;
      }

      auto pos = filter.find('=');
      if (pos == std::string_view::npos or pos == 0) {
        fail(Error::WRONG_FILTER);
        continue;
      }
      std::string group_name{filter.substr(0, pos)};
      if (not logging_system_->getGroup(group_name)) {
        fail(Error::WRONG_GROUP);
        continue;
      }
      auto level = str2lvl(filter.substr(pos + 1));
      if (not level.has_value()) {
        fail(Error::WRONG_LEVEL);
        continue;
      }
      logging_system_->setLevelOfGroup(group_name, level.value());
    }
    return result;
  }

}  // namespace raffle::log
