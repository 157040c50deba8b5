/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/upkeep_keeper.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/state_manager.hpp"
#include "raffle/upkeep_coordinator.hpp"

namespace raffle::app {

  UpkeepKeeper::UpkeepKeeper(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<StateManager> state_manager,
                             qtils::SharedRef<Configuration> app_config,
                             qtils::SharedRef<UpkeepCoordinator> coordinator)
      : logger_{logsys->getLogger("UpkeepKeeper", "keeper")},
        app_config_{std::move(app_config)},
        coordinator_{std::move(coordinator)} {
    state_manager->takeControl(*this);
  }

  UpkeepKeeper::~UpkeepKeeper() {
    stop();
  }

  bool UpkeepKeeper::start() {
    const auto &config = app_config_->keeper();
    if (not config.enabled) {
      SL_INFO(logger_, "Keeper is disabled; draws are triggered via API only");
      return true;
    }

    io_context_ = std::make_shared<boost::asio::io_context>();
    timer_ = std::make_unique<boost::asio::steady_timer>(*io_context_);
    schedule();

    SL_INFO(logger_,
            "Keeper started, checking every {}ms",
            config.period.count());
    io_thread_.emplace([io_context{io_context_}] {
      soralog::util::setThreadName("keeper");
      auto work_guard = boost::asio::make_work_guard(*io_context);
      io_context->run();
    });
    return true;
  }

  void UpkeepKeeper::stop() {
    if (io_thread_.has_value()) {
      io_context_->stop();
      io_thread_->join();
      io_thread_.reset();
    }
  }

  void UpkeepKeeper::schedule() {
    timer_->expires_after(app_config_->keeper().period);
    timer_->async_wait(
        [weak_self{weak_from_this()}](boost::system::error_code ec) {
          if (ec) {
            return;
          }
          if (auto self = weak_self.lock()) {
            self->checkUpkeep();
            self->schedule();
          }
        });
  }

  std::optional<RequestId> UpkeepKeeper::checkUpkeep() {
    auto check = coordinator_->evaluateTrigger();
    if (not check.upkeep_needed) {
      SL_TRACE(logger_,
               "Upkeep not needed: open={} time={} entrants={} balance={}",
               check.conditions.is_open,
               check.conditions.time_passed,
               check.conditions.has_entrants,
               check.conditions.has_balance);
      return std::nullopt;
    }

    // state may change between the check and the request,
    // the coordinator re-evaluates and rejects in that case
    auto res = coordinator_->requestDraw(check.perform_data);
    if (res.has_error()) {
      SL_WARN(logger_, "Upkeep was due, but draw is refused: {}", res.error());
      return std::nullopt;
    }
    SL_VERBOSE(logger_, "Upkeep performed, request #{}", res.value());
    return res.value();
  }

}  // namespace raffle::app
