/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/state_manager_impl.hpp"

#include <csignal>
#include <cstring>
#include <ranges>

#include <fmt/format.h>

#include "log/logger.hpp"

namespace raffle::app {

  StateManagerImpl::SignalRoute StateManagerImpl::shutdown_signals{
      .signals = {SIGINT, SIGTERM, SIGQUIT},
      .handler = &StateManagerImpl::onShutdownSignal,
  };

  StateManagerImpl::SignalRoute StateManagerImpl::rotate_signals{
      .signals = {SIGHUP},
      .handler = &StateManagerImpl::onRotateSignal,
  };

  std::weak_ptr<StateManagerImpl> StateManagerImpl::current;

  namespace {
    void routeSignals(const std::vector<int> &signals, void (*handler)(int)) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
      struct sigaction action;
      memset(&action, 0, sizeof(action));
      action.sa_handler = handler;
      sigemptyset(&action.sa_mask);
      for (auto signal : signals) {
        sigaddset(&action.sa_mask, signal);
      }
      // no delivery while handlers are being replaced
      sigprocmask(SIG_BLOCK, &action.sa_mask, nullptr);
      for (auto signal : signals) {
        sigaction(signal, &action, nullptr);
      }
      sigprocmask(SIG_UNBLOCK, &action.sa_mask, nullptr);
    }
  }  // namespace

  void StateManagerImpl::SignalRoute::install() {
    routeSignals(signals, handler);
    installed = true;
  }

  void StateManagerImpl::SignalRoute::uninstall() {
    if (installed.exchange(false)) {
      routeSignals(signals, SIG_DFL);
    }
  }

  void StateManagerImpl::onShutdownSignal(int signal) {
    shutdown_signals.uninstall();
    if (auto self = current.lock()) {
      SL_TRACE(self->logger_, "Got signal {}, shutting down", signal);
      self->shutdown();
    }
  }

  void StateManagerImpl::onRotateSignal(int signal) {
    if (auto self = current.lock()) {
      SL_TRACE(self->logger_, "Got signal {}, rotating logs", signal);
      self->logging_system_->doLogRotate();
    }
  }

  StateManagerImpl::StateManagerImpl(
      qtils::SharedRef<log::LoggingSystem> logging_system)
      : logger_(logging_system->getLogger("StateManager", "application")),
        logging_system_(std::move(logging_system)) {
    shutdown_signals.install();
    rotate_signals.install();
  }

  StateManagerImpl::~StateManagerImpl() {
    shutdown_signals.uninstall();
    rotate_signals.uninstall();
    current.reset();
  }

  void StateManagerImpl::atPrepare(OnPrepare &&cb) {
    std::lock_guard lock(mutex_);
    if (state_ > State::Prepare) {
      throw AppStateException("adding callback for stage 'prepare'");
    }
    prepare_.emplace_back(std::move(cb));
  }

  void StateManagerImpl::atLaunch(OnLaunch &&cb) {
    std::lock_guard lock(mutex_);
    if (state_ > State::Starting) {
      throw AppStateException("adding callback for stage 'launch'");
    }
    launch_.emplace_back(std::move(cb));
  }

  void StateManagerImpl::atShutdown(OnShutdown &&cb) {
    std::lock_guard lock(mutex_);
    if (state_ > State::ShuttingDown) {
      throw AppStateException("adding callback for stage 'shutdown'");
    }
    shutdown_.emplace_back(std::move(cb));
  }

  void StateManagerImpl::enterStage(State from,
                                    State to,
                                    std::string_view stage) {
    auto state = from;
    if (state_.compare_exchange_strong(state, to)) {
      return;
    }
    if (state != State::ShuttingDown) {
      throw AppStateException(fmt::format("running stage '{}'", stage));
    }
  }

  bool StateManagerImpl::runCallbacks(
      std::vector<std::function<bool()>> &callbacks,
      std::string_view stage,
      State running) {
    auto pending = std::move(callbacks);
    callbacks.clear();
    for (auto &cb : pending) {
      if (state_ != running) {
        return false;
      }
      if (not cb()) {
        SL_ERROR(logger_, "Stage '{}' failed, shutting down", stage);
        shutdown();
        return false;
      }
    }
    return true;
  }

  void StateManagerImpl::doPrepare() {
    std::lock_guard lock(mutex_);
    enterStage(State::Init, State::Prepare, "prepare");
    if (runCallbacks(prepare_, "prepare", State::Prepare)) {
      auto state = State::Prepare;
      state_.compare_exchange_strong(state, State::ReadyToStart);
    }
  }

  void StateManagerImpl::doLaunch() {
    std::lock_guard lock(mutex_);
    enterStage(State::ReadyToStart, State::Starting, "launch");
    if (runCallbacks(launch_, "launch", State::Starting)) {
      auto state = State::Starting;
      state_.compare_exchange_strong(state, State::Works);
    }
  }

  void StateManagerImpl::doShutdown() {
    std::lock_guard lock(mutex_);
    enterStage(State::Works, State::ShuttingDown, "shutdown");

    prepare_.clear();
    launch_.clear();

    // last registered is stopped first
    auto stopping = std::move(shutdown_);
    shutdown_.clear();
    for (auto &cb : std::views::reverse(stopping)) {
      cb();
    }

    state_ = State::ReadyToStop;
  }

  void StateManagerImpl::run() {
    current = weak_from_this();
    if (current.expired()) {
      throw std::logic_error("StateManager must be owned by shared_ptr");
    }

    doPrepare();
    doLaunch();

    if (state_ == State::Works) {
      SL_TRACE(logger_, "Node works, waiting for shutdown request");
      std::unique_lock lock(wait_mutex_);
      wait_cv_.wait(lock, [&] { return state_ == State::ShuttingDown; });
    }

    doShutdown();
    SL_TRACE(logger_, "All stages are done");
  }

  void StateManagerImpl::shutdown() {
    shutdown_signals.uninstall();

    auto state = state_.load();
    if (state == State::ShuttingDown or state == State::ReadyToStop) {
      return;
    }

    SL_TRACE(logger_, "Shutdown requested");
    std::lock_guard lock(wait_mutex_);
    state_ = State::ShuttingDown;
    wait_cv_.notify_one();
  }

}  // namespace raffle::app
