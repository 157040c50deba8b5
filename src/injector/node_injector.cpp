/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 32

#include "injector/node_injector.hpp"

#include <memory>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "app/configuration.hpp"
#include "app/impl/application_impl.hpp"
#include "app/impl/fulfillment_relay.hpp"
#include "app/impl/http_server.hpp"
#include "app/impl/raffle_api.hpp"
#include "app/impl/state_manager_impl.hpp"
#include "app/impl/upkeep_keeper.hpp"
#include "clock/impl/clock_impl.hpp"
#include "log/logger.hpp"
#include "metrics/impl/metrics_impl.hpp"
#include "metrics/impl/prometheus/handler_impl.hpp"
#include "metrics/registry.hpp"
#include "payment/impl/in_memory_payment_rail.hpp"
#include "raffle/event_log.hpp"
#include "raffle/raffle_ledger.hpp"
#include "raffle/upkeep_coordinator.hpp"
#include "randomness/impl/vrf_coordinator_mock.hpp"

namespace {
  namespace di = boost::di;
  using namespace raffle;  // NOLINT

  template <typename C>
  auto useConfig(C c) {
    return boost::di::bind<std::decay_t<C>>().to(
        std::move(c))[boost::di::override];
  }

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<app::StateManager>.to<app::StateManagerImpl>(),
        di::bind<app::Application>.to<app::ApplicationImpl>(),
        di::bind<clock::SystemClock>.to<clock::SystemClockImpl>(),
        di::bind<clock::SteadyClock>.to<clock::SteadyClockImpl>(),
        di::bind<metrics::Registry>.to(metrics::createRegistry()),
        di::bind<metrics::Metrics>.to<metrics::MetricsImpl>(),
        di::bind<metrics::Handler>.to<metrics::PrometheusHandler>(),
        di::bind<randomness::RandomnessProvider, randomness::VrfCoordinatorMock>.to<randomness::VrfCoordinatorMock>(),
        di::bind<randomness::VrfCoordinatorMock::Config>.to([](const auto &injector) {
          const auto &oracle = injector.template create<app::Configuration const &>().oracle();
          return randomness::VrfCoordinatorMock::Config{
              .base_fee = oracle.base_fee,
              .gas_price_link = oracle.gas_price_link,
          };
        }),
        di::bind<payment::PaymentRail>.to<payment::InMemoryPaymentRail>(),
        di::bind<payment::InMemoryPaymentRail::Config>.to([](const auto &injector) {
          const auto &payment = injector.template create<app::Configuration const &>().payment();
          return payment::InMemoryPaymentRail::Config{
              .rejected_recipients = payment.rejected_recipients,
          };
        }),
        useConfig(config->raffle()),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace raffle::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::Application> NodeInjector::injectApplication() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::Application>>();
  }
}  // namespace raffle::injector
