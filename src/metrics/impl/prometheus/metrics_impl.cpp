/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/metrics_impl.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>

namespace raffle::metrics {

  void PrometheusCounter::inc() {
    counter_.Increment();
  }

  void PrometheusGauge::set(double val) {
    gauge_.Set(val);
  }

  void PrometheusHistogram::observe(double value) {
    histogram_.Observe(value);
  }

}  // namespace raffle::metrics
