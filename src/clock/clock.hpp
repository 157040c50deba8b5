/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace raffle::clock {

  /// Milliseconds since unix epoch
  using UnixTime = std::chrono::milliseconds;

  /**
   * Wall clock. Stamps cycles and events, and is what the draw interval is
   * measured against.
   */
  class SystemClock {
   public:
    virtual ~SystemClock() = default;

    [[nodiscard]] virtual UnixTime now() const = 0;
  };

  /**
   * Monotonic clock. Measures how long a draw stays in flight.
   */
  class SteadyClock {
   public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
  };

}  // namespace raffle::clock
