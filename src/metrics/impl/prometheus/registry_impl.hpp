/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace raffle::metrics {

  class PrometheusRegistry final : public Registry {
   public:
    PrometheusRegistry();

    Gauge *gauge(const std::string &name,
                 const std::string &help,
                 const Labels &labels) override;

    Counter *counter(const std::string &name,
                     const std::string &help,
                     const Labels &labels) override;

    Histogram *histogram(const std::string &name,
                         const std::string &help,
                         const std::vector<double> &buckets) override;

    /// Collectable to be served by the handler
    std::weak_ptr<prometheus::Registry> registry() const {
      return registry_;
    }

   private:
    /// prometheus family `P` and our adapters `A` of its members
    template <typename P, typename A>
    struct Family {
      prometheus::Family<P> *family = nullptr;
      std::map<Labels, std::unique_ptr<A>> members;
    };

    template <typename P, typename A, typename Builder, typename... Args>
    A *lookup(std::unordered_map<std::string, Family<P, A>> &families,
              Builder &&builder,
              const std::string &name,
              const std::string &help,
              const Labels &labels,
              Args &&...args);

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex mutex_;
    std::unordered_map<std::string, Family<prometheus::Gauge, PrometheusGauge>>
        gauges_;
    std::unordered_map<std::string,
                       Family<prometheus::Counter, PrometheusCounter>>
        counters_;
    std::unordered_map<std::string,
                       Family<prometheus::Histogram, PrometheusHistogram>>
        histograms_;
  };

}  // namespace raffle::metrics
