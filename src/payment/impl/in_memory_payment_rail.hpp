/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <set>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "payment/payment_rail.hpp"

namespace raffle::payment {

  /**
   * Payment rail keeping credited balances in memory.
   * Recipients listed in the config refuse every transfer, which is how a
   * winner that cannot receive funds is rehearsed.
   */
  class InMemoryPaymentRail final : public PaymentRail {
   public:
    enum class Error : uint8_t {
      RECIPIENT_REJECTED = 1,
    };

    struct Config {
      std::vector<Address> rejected_recipients;
    };

    struct Payout {
      Address to;
      Amount amount;
    };

    InMemoryPaymentRail(qtils::SharedRef<log::LoggingSystem> logsys,
                        Config config);

    outcome::result<void> transfer(const Address &to,
                                   const Amount &amount) override;

    Amount balanceOf(const Address &address) const override;

    void setRejecting(const Address &address, bool reject);

    std::vector<Payout> payouts() const;

   private:
    log::Logger logger_;

    mutable std::mutex mutex_;
    std::set<Address> rejected_;
    std::map<Address, Amount> balances_;
    std::vector<Payout> payouts_;
  };

}  // namespace raffle::payment

OUTCOME_HPP_DECLARE_ERROR(raffle::payment, InMemoryPaymentRail::Error);
