/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

namespace raffle::metrics {

  std::shared_ptr<Registry> createRegistry() {
    return std::make_shared<PrometheusRegistry>();
  }

  PrometheusRegistry::PrometheusRegistry()
      : registry_{std::make_shared<prometheus::Registry>()} {}

  template <typename P, typename A, typename Builder, typename... Args>
  A *PrometheusRegistry::lookup(
      std::unordered_map<std::string, Family<P, A>> &families,
      Builder &&builder,
      const std::string &name,
      const std::string &help,
      const Labels &labels,
      Args &&...args) {
    std::lock_guard lock{mutex_};
    auto &entry = families[name];
    if (entry.family == nullptr) {
      entry.family = &builder.Name(name).Help(help).Register(*registry_);
    }
    auto &member = entry.members[labels];
    if (not member) {
      member = std::make_unique<A>(
          entry.family->Add(labels, std::forward<Args>(args)...));
    }
    return member.get();
  }

  Gauge *PrometheusRegistry::gauge(const std::string &name,
                                   const std::string &help,
                                   const Labels &labels) {
    return lookup(gauges_, prometheus::BuildGauge(), name, help, labels);
  }

  Counter *PrometheusRegistry::counter(const std::string &name,
                                       const std::string &help,
                                       const Labels &labels) {
    return lookup(counters_, prometheus::BuildCounter(), name, help, labels);
  }

  Histogram *PrometheusRegistry::histogram(
      const std::string &name,
      const std::string &help,
      const std::vector<double> &buckets) {
    return lookup(histograms_,
                  prometheus::BuildHistogram(),
                  name,
                  help,
                  Labels{},
                  prometheus::Histogram::BucketBoundaries{buckets});
  }

}  // namespace raffle::metrics
