/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "app/state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <qtils/shared_ref.hpp>

namespace soralog {
  class Logger;
}  // namespace soralog
namespace raffle::log {
  class LoggingSystem;
}  // namespace raffle::log

namespace raffle::app {

  /**
   * Stage runner of the node process.
   *
   * While alive it owns SIGINT, SIGTERM and SIGQUIT (request shutdown) and
   * SIGHUP (rotate log sinks). Only one instance should exist at a time.
   */
  class StateManagerImpl  // non-final, tests reach the stage methods
      : public StateManager,
        public std::enable_shared_from_this<StateManagerImpl> {
   public:
    explicit StateManagerImpl(
        qtils::SharedRef<log::LoggingSystem> logging_system);

    ~StateManagerImpl() override;

    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    State state() const override {
      return state_;
    }

   protected:
    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    /// Set of signals routed to one static handler
    struct SignalRoute {
      std::vector<int> signals;
      void (*handler)(int);
      std::atomic_bool installed{false};

      void install();
      void uninstall();
    };

    static SignalRoute shutdown_signals;
    static SignalRoute rotate_signals;
    static std::weak_ptr<StateManagerImpl> current;

    static void onShutdownSignal(int signal);
    static void onRotateSignal(int signal);

    /// Moves state `from` -> `to`; tolerates a pending shutdown
    void enterStage(State from, State to, std::string_view stage);

    /// Runs callbacks while the stage is not aborted
    bool runCallbacks(std::vector<std::function<bool()>> &callbacks,
                      std::string_view stage,
                      State running);

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<log::LoggingSystem> logging_system_;

    std::atomic<State> state_ = State::Init;

    std::recursive_mutex mutex_;
    std::vector<OnPrepare> prepare_;
    std::vector<OnLaunch> launch_;
    std::vector<OnShutdown> shutdown_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
  };

}  // namespace raffle::app
