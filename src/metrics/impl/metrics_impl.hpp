/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "metrics/metrics.hpp"

namespace raffle::metrics {
  class Registry;

  /**
   * Metrics of `all_metrics.def` living in a Registry. Plain metrics are
   * looked up once at construction, labeled ones on every access.
   */
  class MetricsImpl final : public Metrics {
   public:
    explicit MetricsImpl(qtils::SharedRef<Registry> registry);

    // clang-format off
#define METRIC_GAUGE(field, ...)            Gauge *field() override;
#define METRIC_GAUGE_LABELS(field, ...)     Gauge *field(const Labels &labels) override;
#define METRIC_COUNTER(field, ...)          Counter *field() override;
#define METRIC_COUNTER_LABELS(field, ...)   Counter *field(const Labels &labels) override;
#define METRIC_HISTOGRAM(field, ...)        Histogram *field() override;
    // clang-format on

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM

   private:
    qtils::SharedRef<Registry> registry_;

    // clang-format off
#define METRIC_GAUGE(field, ...)            Gauge *field##_ = nullptr;
#define METRIC_GAUGE_LABELS(...)
#define METRIC_COUNTER(field, ...)          Counter *field##_ = nullptr;
#define METRIC_COUNTER_LABELS(...)
#define METRIC_HISTOGRAM(field, ...)        Histogram *field##_ = nullptr;
    // clang-format on

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM
  };

}  // namespace raffle::metrics
