/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/metrics_impl.hpp"

#include "metrics/registry.hpp"

#define BUCKETS(...) std::vector<double>{__VA_ARGS__}

namespace raffle::metrics {

  MetricsImpl::MetricsImpl(qtils::SharedRef<Registry> registry)
      : registry_{std::move(registry)} {
    // clang-format off
#define METRIC_GAUGE(field, name, help)                 field##_ = registry_->gauge(name, help);
#define METRIC_GAUGE_LABELS(...)
#define METRIC_COUNTER(field, name, help)               field##_ = registry_->counter(name, help);
#define METRIC_COUNTER_LABELS(...)
#define METRIC_HISTOGRAM(field, name, help, buckets)    field##_ = registry_->histogram(name, help, BUCKETS buckets);
    // clang-format on

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM
  }

  // clang-format off
#define METRIC_GAUGE(field, ...)                                        \
  Gauge *MetricsImpl::field() { return field##_; }
#define METRIC_GAUGE_LABELS(field, name, help, label_names)             \
  Gauge *MetricsImpl::field(const Labels &labels) {                     \
    return registry_->gauge(name, help, labels);                        \
  }
#define METRIC_COUNTER(field, ...)                                      \
  Counter *MetricsImpl::field() { return field##_; }
#define METRIC_COUNTER_LABELS(field, name, help, label_names)           \
  Counter *MetricsImpl::field(const Labels &labels) {                   \
    return registry_->counter(name, help, labels);                      \
  }
#define METRIC_HISTOGRAM(field, ...)                                    \
  Histogram *MetricsImpl::field() { return field##_; }
  // clang-format on

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM

}  // namespace raffle::metrics

#undef BUCKETS
