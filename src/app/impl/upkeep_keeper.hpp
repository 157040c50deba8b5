/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <thread>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "raffle/types.hpp"

namespace boost::asio {
  class io_context;
  class steady_timer;
}  // namespace boost::asio

namespace raffle {
  class UpkeepCoordinator;
}  // namespace raffle

namespace raffle::app {
  class Configuration;
  class StateManager;

  /**
   * Built-in upkeep trigger source.
   * Every `keeper.period` asks the coordinator whether a draw is due and
   * requests it with the returned diagnostic payload.
   */
  class UpkeepKeeper : public std::enable_shared_from_this<UpkeepKeeper> {
   public:
    UpkeepKeeper(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<StateManager> state_manager,
                 qtils::SharedRef<Configuration> app_config,
                 qtils::SharedRef<UpkeepCoordinator> coordinator);
    ~UpkeepKeeper();

    bool start();
    void stop();

    /**
     * One upkeep round
     * @return id of the request issued in this round, if any
     */
    std::optional<RequestId> checkUpkeep();

   private:
    void schedule();

    log::Logger logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<UpkeepCoordinator> coordinator_;

    std::shared_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::optional<std::thread> io_thread_;
  };

}  // namespace raffle::app
