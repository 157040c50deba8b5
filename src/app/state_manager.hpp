/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace raffle::app {

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(const std::string &message)
        : std::runtime_error("Wrong workflow at " + message) {}
  };

  /**
   * Drives the node through its stages and owns the shutdown request.
   * Components hook into stages by `takeControl` or by explicit callbacks.
   */
  class StateManager {
   public:
    using OnPrepare = std::function<bool()>;
    using OnLaunch = std::function<bool()>;
    using OnShutdown = std::function<void()>;

    enum class State : uint8_t {
      Init,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~StateManager() = default;

    /**
     * @brief Execute \param cb at stage 'preparations' of application
     */
    virtual void atPrepare(OnPrepare &&cb) = 0;

    /**
     * @brief Execute \param cb immediately before start application
     */
    virtual void atLaunch(OnLaunch &&cb) = 0;

    /**
     * @brief Execute \param cb at stage of shutting down application
     */
    virtual void atShutdown(OnShutdown &&cb) = 0;

    /**
     * @brief Registers `prepare`, `start` and `stop` of \param entity,
     * whichever of them it has. A `prepare` or `start` returning void counts
     * as success.
     */
    template <typename Controlled>
    void takeControl(Controlled &entity) {
      if constexpr (requires { entity.prepare(); }) {
        atPrepare([&entity]() -> bool {
          if constexpr (std::is_void_v<decltype(entity.prepare())>) {
            entity.prepare();
            return true;
          } else {
            return entity.prepare();
          }
        });
      }
      if constexpr (requires { entity.start(); }) {
        atLaunch([&entity]() -> bool {
          if constexpr (std::is_void_v<decltype(entity.start())>) {
            entity.start();
            return true;
          } else {
            return entity.start();
          }
        });
      }
      if constexpr (requires { entity.stop(); }) {
        atShutdown([&entity] { entity.stop(); });
      }
    }

    /// Start application life cycle
    virtual void run() = 0;

    /// Initiate shutting down (thread-safe)
    virtual void shutdown() = 0;

    /// Get current stage
    virtual State state() const = 0;

   protected:
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;
  };

}  // namespace raffle::app
