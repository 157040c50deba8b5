/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef RAFFLE_BUILD_VERSION
#define RAFFLE_BUILD_VERSION "unknown"
#endif

namespace raffle {
  const std::string &buildVersion() {
    static const std::string version(RAFFLE_BUILD_VERSION);
    return version;
  }
}  // namespace raffle
