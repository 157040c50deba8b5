/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

namespace raffle::metrics {
  using Labels = std::map<std::string, std::string>;

  /// Monotonically increasing value
  class Counter {
   public:
    virtual ~Counter() = default;

    virtual void inc() = 0;
  };

  /// Value which is overwritten on every update
  class Gauge {
   public:
    virtual ~Gauge() = default;

    virtual void set(double val) = 0;

    template <typename T>
    void set(T val) {
      set(static_cast<double>(val));
    }
  };

  /// Distribution of observed values over fixed buckets
  class Histogram {
   public:
    virtual ~Histogram() = default;

    virtual void observe(double value) = 0;
  };

  /**
   * Every metric of the node, one accessor per entry of
   * `metrics/all_metrics.def`. Returned pointers stay valid as long as the
   * Metrics instance.
   */
  class Metrics {
   public:
    virtual ~Metrics() = default;

    // clang-format off
#define METRIC_GAUGE(field, ...)            virtual Gauge *field() = 0;
#define METRIC_GAUGE_LABELS(field, ...)     virtual Gauge *field(const Labels &) = 0;
#define METRIC_COUNTER(field, ...)          virtual Counter *field() = 0;
#define METRIC_COUNTER_LABELS(field, ...)   virtual Counter *field(const Labels &) = 0;
#define METRIC_HISTOGRAM(field, ...)        virtual Histogram *field() = 0;
    // clang-format on

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM
  };
}  // namespace raffle::metrics
