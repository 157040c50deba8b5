/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <boost/beast/http/status.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "utils/http.hpp"

namespace raffle {
  class EventLog;
  class RaffleLedger;
  class UpkeepCoordinator;
}  // namespace raffle

namespace raffle::metrics {
  class Handler;
}  // namespace raffle::metrics

namespace raffle::payment {
  class PaymentRail;
}  // namespace raffle::payment

namespace raffle::app {
  class Configuration;

  /**
   * Routes of the node HTTP API.
   *
   * Reads are served from snapshots, `enter` maps to `deposit` and
   * `POST upkeep` maps to `requestDraw`. Raffle errors become 4xx responses
   * with `{"error": message}` bodies.
   */
  class RaffleApi {
   public:
    static constexpr std::string_view kPrefix = "/raffle/v0";
    static constexpr size_t kDefaultEventsLimit = 100;
    static constexpr size_t kMaxEventsLimit = 1000;

    RaffleApi(qtils::SharedRef<log::LoggingSystem> logsys,
              qtils::SharedRef<Configuration> app_config,
              qtils::SharedRef<RaffleLedger> ledger,
              qtils::SharedRef<UpkeepCoordinator> coordinator,
              qtils::SharedRef<EventLog> event_log,
              qtils::SharedRef<payment::PaymentRail> payment_rail,
              qtils::SharedRef<metrics::Handler> metrics_handler);

    http::Response handle(const http::Request &request) const;

   private:
    http::Response health() const;
    http::Response state() const;
    http::Response entrant(std::string_view index) const;
    http::Response enter(const http::Request &request) const;
    http::Response checkUpkeep() const;
    http::Response performUpkeep(const http::Request &request) const;
    http::Response events(std::string_view query) const;
    http::Response balance(std::string_view address) const;
    http::Response metrics() const;

    log::Logger logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<RaffleLedger> ledger_;
    qtils::SharedRef<UpkeepCoordinator> coordinator_;
    qtils::SharedRef<EventLog> event_log_;
    qtils::SharedRef<payment::PaymentRail> payment_rail_;
    qtils::SharedRef<metrics::Handler> metrics_handler_;
  };

}  // namespace raffle::app
