/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "metrics/metrics.hpp"

namespace raffle::metrics {

  /**
   * Owner of metric families. A family is created by the first lookup of
   * its name; `help` and `buckets` of later lookups are ignored.
   * Lookups with the same name and labels return the same metric.
   */
  class Registry {
   public:
    virtual ~Registry() = default;

    virtual Gauge *gauge(const std::string &name,
                         const std::string &help,
                         const Labels &labels = {}) = 0;

    virtual Counter *counter(const std::string &name,
                             const std::string &help,
                             const Labels &labels = {}) = 0;

    virtual Histogram *histogram(const std::string &name,
                                 const std::string &help,
                                 const std::vector<double> &buckets) = 0;
  };

  std::shared_ptr<Registry> createRegistry();

}  // namespace raffle::metrics
