/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <unistd.h>

#include "app/configuration.hpp"
#include "app/impl/fulfillment_relay.hpp"
#include "app/impl/http_server.hpp"
#include "app/impl/upkeep_keeper.hpp"
#include "app/state_manager.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "metrics/handler.hpp"
#include "metrics/metrics.hpp"
#include "metrics/registry.hpp"

namespace raffle::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<metrics::Registry> metrics_registry,
      qtils::SharedRef<metrics::Handler> metrics_handler,
      qtils::SharedRef<clock::SystemClock> system_clock,
      qtils::SharedRef<HttpServer> http_server,
      qtils::SharedRef<UpkeepKeeper> keeper,
      qtils::SharedRef<FulfillmentRelay> relay)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        state_manager_(std::move(state_manager)),
        metrics_(std::move(metrics)),
        system_clock_(std::move(system_clock)),
        http_server_(std::move(http_server)),
        keeper_(std::move(keeper)),
        relay_(std::move(relay)) {
    metrics_handler->registerCollectable(*metrics_registry);

    // Metric for exposing name and version of node
    metrics_
        ->app_build_info({
            {"name", app_config_->nodeName()},
            {"version", app_config_->nodeVersion()},
        })
        ->set(1);
  }

  void ApplicationImpl::run() {
    logger_->info("Start as node version '{}' named as '{}' with PID {}",
                  app_config_->nodeVersion(),
                  app_config_->nodeName(),
                  getpid());

    const auto &raffle = app_config_->raffle();
    SL_INFO(logger_,
            "Raffle: entrance fee {}, interval {}ms, subscription #{}",
            raffle.entrance_fee,
            raffle.interval.count(),
            raffle.subscription_id);

    // Set process start time metric
    metrics_->app_process_start_time()->set(
        std::chrono::duration_cast<std::chrono::seconds>(system_clock_->now())
            .count());

    state_manager_->run();
  }

}  // namespace raffle::app
