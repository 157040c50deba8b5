/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace raffle::app {

  /// @class Application - raffle node interface
  class Application {
   public:
    virtual ~Application() = default;

    /// Runs node until shutdown is requested
    virtual void run() = 0;
  };

}  // namespace raffle::app
