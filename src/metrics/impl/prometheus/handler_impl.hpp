/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <prometheus/collectable.h>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "metrics/handler.hpp"

namespace raffle::metrics {

  class PrometheusHandler : public Handler {
   public:
    explicit PrometheusHandler(qtils::SharedRef<log::LoggingSystem> logsys);
    ~PrometheusHandler() override = default;

    void registerCollectable(Registry &registry) override;

    std::string collect() override;

   private:
    void registerCollectable(
        const std::weak_ptr<prometheus::Collectable> &collectable);

    log::Logger logger_;
    std::mutex collectables_mutex_;
    std::vector<std::weak_ptr<prometheus::Collectable>> collectables_;
  };

}  // namespace raffle::metrics
