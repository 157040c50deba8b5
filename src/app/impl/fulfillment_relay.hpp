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
#include "raffle/event_log.hpp"

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace raffle::randomness {
  class VrfCoordinatorMock;
}  // namespace raffle::randomness

namespace raffle::app {
  class Configuration;
  class StateManager;

  /**
   * Plays the oracle node for the in-process coordinator: provisions the
   * raffle's subscription and fulfills every requested draw after
   * `oracle.fulfillment-delay`.
   */
  class FulfillmentRelay
      : public std::enable_shared_from_this<FulfillmentRelay> {
   public:
    FulfillmentRelay(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<StateManager> state_manager,
        qtils::SharedRef<Configuration> app_config,
        qtils::SharedRef<EventLog> event_log,
        qtils::SharedRef<randomness::VrfCoordinatorMock> coordinator);
    ~FulfillmentRelay();

    bool prepare();
    bool start();
    void stop();

    /// Fulfills `request_id` right away
    void relay(RequestId request_id);

   private:
    void onEvent(const EventRecord &record);

    log::Logger logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<EventLog> event_log_;
    qtils::SharedRef<randomness::VrfCoordinatorMock> coordinator_;

    std::optional<EventLog::SubscriptionHandle> subscription_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::optional<std::thread> io_thread_;
  };

}  // namespace raffle::app
