/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace raffle {
  /**
   * @returns string of version which was set at build
   */
  const std::string &buildVersion();
}  // namespace raffle
