/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/handler_impl.hpp"

#include <prometheus/text_serializer.h>

#include "metrics/impl/prometheus/registry_impl.hpp"

using prometheus::Collectable;
using prometheus::MetricFamily;
using prometheus::TextSerializer;

namespace {
  std::vector<MetricFamily> collectMetrics(
      const std::vector<std::weak_ptr<Collectable>> &collectables) {
    std::vector<MetricFamily> collected_metrics;

    for (auto &&wcollectable : collectables) {
      auto collectable = wcollectable.lock();
      if (not collectable) {
        continue;
      }

      auto &&metrics = collectable->Collect();
      collected_metrics.insert(collected_metrics.end(),
                               std::make_move_iterator(metrics.begin()),
                               std::make_move_iterator(metrics.end()));
    }

    return collected_metrics;
  }
}  // namespace

namespace raffle::metrics {

  PrometheusHandler::PrometheusHandler(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("PrometheusHandler", "metrics")} {}

  std::string PrometheusHandler::collect() {
    std::vector<MetricFamily> metrics;
    {
      std::lock_guard lock{collectables_mutex_};
      metrics = collectMetrics(collectables_);
    }

    const TextSerializer serializer;
    return serializer.Serialize(metrics);
  }

  // it is called once on init
  void PrometheusHandler::registerCollectable(Registry &registry) {
    if (auto *pregistry = dynamic_cast<PrometheusRegistry *>(&registry)) {
      registerCollectable(pregistry->registry());
      return;
    }
    SL_WARN(logger_, "Registry is not backed by prometheus; not collected");
  }

  void PrometheusHandler::registerCollectable(
      const std::weak_ptr<Collectable> &collectable) {
    std::lock_guard lock{collectables_mutex_};
    std::erase_if(collectables_, [](const std::weak_ptr<Collectable> &item) {
      return item.expired();
    });
    collectables_.push_back(collectable);
  }

}  // namespace raffle::metrics
