/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace raffle::clock {

  UnixTime SystemClockImpl::now() const {
    return std::chrono::duration_cast<UnixTime>(
        std::chrono::system_clock::now().time_since_epoch());
  }

  SteadyClock::TimePoint SteadyClockImpl::now() const {
    return std::chrono::steady_clock::now();
  }

}  // namespace raffle::clock
