/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace raffle::metrics {

  class Registry;

  /**
   * @brief Serializer of registered metrics for the `/metrics` endpoint
   */
  class Handler {
   public:
    virtual ~Handler() = default;

    /**
     * @brief registers general type metrics registry for metrics collection
     */
    virtual void registerCollectable(Registry &registry) = 0;

    /// Text exposition of everything registered
    virtual std::string collect() = 0;
  };

}  // namespace raffle::metrics
