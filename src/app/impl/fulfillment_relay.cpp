/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/fulfillment_relay.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/state_manager.hpp"
#include "randomness/impl/vrf_coordinator_mock.hpp"

namespace raffle::app {

  FulfillmentRelay::FulfillmentRelay(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<Configuration> app_config,
      qtils::SharedRef<EventLog> event_log,
      qtils::SharedRef<randomness::VrfCoordinatorMock> coordinator)
      : logger_{logsys->getLogger("FulfillmentRelay", "randomness")},
        app_config_{std::move(app_config)},
        event_log_{std::move(event_log)},
        coordinator_{std::move(coordinator)},
        io_context_{std::make_shared<boost::asio::io_context>()} {
    state_manager->takeControl(*this);
  }

  FulfillmentRelay::~FulfillmentRelay() {
    stop();
  }

  bool FulfillmentRelay::prepare() {
    const auto &raffle = app_config_->raffle();
    const auto &oracle = app_config_->oracle();

    auto subscription_id = coordinator_->createSubscription();
    if (subscription_id != raffle.subscription_id) {
      SL_CRITICAL(logger_,
                  "Raffle is configured for subscription #{}, but the "
                  "coordinator created #{}",
                  raffle.subscription_id,
                  subscription_id);
      return false;
    }
    if (auto res =
            coordinator_->fundSubscription(subscription_id,
                                           oracle.subscription_fund);
        res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't fund subscription #{}: {}",
                  subscription_id,
                  res.error());
      return false;
    }
    SL_INFO(logger_,
            "Subscription #{} funded with {}",
            subscription_id,
            oracle.subscription_fund);

    subscription_ = event_log_->subscribe(
        [weak_self{weak_from_this()}](const EventRecord &record) {
          if (auto self = weak_self.lock()) {
            self->onEvent(record);
          }
        });
    return true;
  }

  bool FulfillmentRelay::start() {
    io_thread_.emplace([io_context{io_context_}] {
      soralog::util::setThreadName("relay");
      auto work_guard = boost::asio::make_work_guard(*io_context);
      io_context->run();
    });
    return true;
  }

  void FulfillmentRelay::stop() {
    if (subscription_.has_value()) {
      event_log_->unsubscribe(subscription_.value());
      subscription_.reset();
    }
    if (io_thread_.has_value()) {
      io_context_->stop();
      io_thread_->join();
      io_thread_.reset();
    }
  }

  void FulfillmentRelay::onEvent(const EventRecord &record) {
    auto *requested = std::get_if<DrawRequestedEvent>(&record.event);
    if (requested == nullptr) {
      return;
    }
    // only schedules; the raffle lock may be held here
    auto request_id = requested->request_id;
    auto delay = app_config_->oracle().fulfillment_delay;
    auto deliver = [weak_self{weak_from_this()}, request_id, delay] {
      auto self = weak_self.lock();
      if (not self) {
        return;
      }
      auto timer = std::make_shared<boost::asio::steady_timer>(
          *self->io_context_, delay);
      timer->async_wait(
          [weak_self, timer, request_id](boost::system::error_code ec) {
            if (ec) {
              return;
            }
            if (auto relay = weak_self.lock()) {
              relay->relay(request_id);
            }
          });
    };
    boost::asio::post(*io_context_, std::move(deliver));
    SL_DEBUG(logger_,
             "Request #{} will be fulfilled in {}ms",
             request_id,
             delay.count());
  }

  void FulfillmentRelay::relay(RequestId request_id) {
    auto res = coordinator_->fulfillRandomWords(request_id);
    if (res.has_error()) {
      SL_ERROR(logger_,
               "Can't fulfill request #{}: {}",
               request_id,
               res.error());
      return;
    }
    const auto &fulfillment = res.value();
    if (fulfillment.success) {
      SL_VERBOSE(logger_,
                 "Request #{} fulfilled, charged {}",
                 request_id,
                 fulfillment.payment);
    } else {
      SL_WARN(logger_,
              "Request #{} delivered, but the consumer rejected it; "
              "charged {}",
              request_id,
              fulfillment.payment);
    }
  }

}  // namespace raffle::app
