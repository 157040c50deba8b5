/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "raffle/types.hpp"

namespace raffle::payment {

  /**
   * Direct value transfer to a payable identity
   */
  class PaymentRail {
   public:
    virtual ~PaymentRail() = default;

    /// Moves `amount` to `to`; on error nothing is moved
    virtual outcome::result<void> transfer(const Address &to,
                                           const Amount &amount) = 0;

    /// Funds credited to `address` so far
    virtual Amount balanceOf(const Address &address) const = 0;
  };

}  // namespace raffle::payment
