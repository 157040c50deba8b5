/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace raffle::clock {

  class SystemClockImpl final : public SystemClock {
   public:
    UnixTime now() const override;
  };

  class SteadyClockImpl final : public SteadyClock {
   public:
    TimePoint now() const override;
  };

}  // namespace raffle::clock
