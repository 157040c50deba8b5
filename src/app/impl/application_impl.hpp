/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"

namespace raffle::app {
  class Configuration;
  class FulfillmentRelay;
  class HttpServer;
  class StateManager;
  class UpkeepKeeper;
}  // namespace raffle::app

namespace raffle::clock {
  class SystemClock;
}  // namespace raffle::clock

namespace soralog {
  class Logger;
}  // namespace soralog

namespace raffle::log {
  class LoggingSystem;
}  // namespace raffle::log

namespace raffle::metrics {
  class Handler;
  class Metrics;
  class Registry;
}  // namespace raffle::metrics

namespace raffle::app {

  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<StateManager> state_manager,
                    qtils::SharedRef<metrics::Metrics> metrics,
                    qtils::SharedRef<metrics::Registry> metrics_registry,
                    qtils::SharedRef<metrics::Handler> metrics_handler,
                    qtils::SharedRef<clock::SystemClock> system_clock,
                    qtils::SharedRef<HttpServer> http_server,
                    qtils::SharedRef<UpkeepKeeper> keeper,
                    qtils::SharedRef<FulfillmentRelay> relay);

    void run() override;

   private:
    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<StateManager> state_manager_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<clock::SystemClock> system_clock_;

    // held to keep stage callbacks valid
    qtils::SharedRef<HttpServer> http_server_;
    qtils::SharedRef<UpkeepKeeper> keeper_;
    qtils::SharedRef<FulfillmentRelay> relay_;
  };

}  // namespace raffle::app
