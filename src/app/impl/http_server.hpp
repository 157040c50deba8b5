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

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace raffle::app {
  class Configuration;
  class RaffleApi;
  class StateManager;

  /**
   * Serves RaffleApi on `api.endpoint` from a dedicated io thread
   */
  class HttpServer : public std::enable_shared_from_this<HttpServer> {
   public:
    HttpServer(qtils::SharedRef<log::LoggingSystem> logsys,
               qtils::SharedRef<StateManager> state_manager,
               qtils::SharedRef<Configuration> app_config,
               qtils::SharedRef<RaffleApi> api);
    ~HttpServer();

    bool start();
    void stop();

   private:
    log::Logger log_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<RaffleApi> api_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::optional<std::thread> io_thread_;
  };
}  // namespace raffle::app
