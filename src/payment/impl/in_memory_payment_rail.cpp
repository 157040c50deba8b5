/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "payment/impl/in_memory_payment_rail.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(raffle::payment, InMemoryPaymentRail::Error, e) {
  using E = raffle::payment::InMemoryPaymentRail::Error;
  switch (e) {
    case E::RECIPIENT_REJECTED:
      return "Recipient rejected the transfer";
  }
  return "Unknown payment error";
}

namespace raffle::payment {

  InMemoryPaymentRail::InMemoryPaymentRail(
      qtils::SharedRef<log::LoggingSystem> logsys, Config config)
      : logger_{logsys->getLogger("PaymentRail", "payment")},
        rejected_{config.rejected_recipients.begin(),
                  config.rejected_recipients.end()} {
    for (auto &address : rejected_) {
      SL_WARN(logger_, "Transfers to {} will be rejected", toString(address));
    }
  }

  outcome::result<void> InMemoryPaymentRail::transfer(const Address &to,
                                                      const Amount &amount) {
    std::lock_guard lock{mutex_};
    if (rejected_.contains(to)) {
      SL_WARN(logger_, "Transfer of {} to {} rejected", amount, toString(to));
      return Error::RECIPIENT_REJECTED;
    }
    balances_[to] += amount;
    payouts_.emplace_back(Payout{.to = to, .amount = amount});
    SL_DEBUG(logger_, "Transferred {} to {}", amount, toString(to));
    return outcome::success();
  }

  Amount InMemoryPaymentRail::balanceOf(const Address &address) const {
    std::lock_guard lock{mutex_};
    auto it = balances_.find(address);
    if (it == balances_.end()) {
      return 0;
    }
    return it->second;
  }

  void InMemoryPaymentRail::setRejecting(const Address &address, bool reject) {
    std::lock_guard lock{mutex_};
    if (reject) {
      rejected_.emplace(address);
    } else {
      rejected_.erase(address);
    }
  }

  std::vector<InMemoryPaymentRail::Payout> InMemoryPaymentRail::payouts()
      const {
    std::lock_guard lock{mutex_};
    return payouts_;
  }

}  // namespace raffle::payment
