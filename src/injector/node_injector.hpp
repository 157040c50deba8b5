/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace raffle::log {
  class LoggingSystem;
}  // namespace raffle::log

namespace raffle::app {
  class Configuration;
  class Application;
}  // namespace raffle::app

namespace raffle::injector {

  /**
   * Dependency injector of the raffle node. Provides all components required
   * by the application: the raffle itself, its randomness and payment
   * collaborators, the API server, the keeper and the relay.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace raffle::injector
