/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

namespace prometheus {
  class Counter;
  class Gauge;
  class Histogram;
}  // namespace prometheus

namespace raffle::metrics {

  /// Adapters over metrics owned by a prometheus family

  class PrometheusCounter final : public Counter {
   public:
    explicit PrometheusCounter(prometheus::Counter &counter)
        : counter_{counter} {}

    void inc() override;

   private:
    prometheus::Counter &counter_;
  };

  class PrometheusGauge final : public Gauge {
   public:
    explicit PrometheusGauge(prometheus::Gauge &gauge) : gauge_{gauge} {}

    void set(double val) override;

   private:
    prometheus::Gauge &gauge_;
  };

  class PrometheusHistogram final : public Histogram {
   public:
    explicit PrometheusHistogram(prometheus::Histogram &histogram)
        : histogram_{histogram} {}

    void observe(double value) override;

   private:
    prometheus::Histogram &histogram_;
  };

}  // namespace raffle::metrics
