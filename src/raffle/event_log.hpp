/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "raffle/raffle_events.hpp"

namespace raffle::clock {
  class SystemClock;
}  // namespace raffle::clock

namespace raffle {

  /**
   * Append-only log of raffle notifications.
   *
   * Every appended event gets the next sequence number (starting from 1) and
   * the current wall-clock time. Listeners are invoked synchronously from
   * `append`, while the raffle lock may be held, so they must not call back
   * into the ledger or the coordinator.
   */
  class EventLog {
   public:
    using Listener = std::function<void(const EventRecord &)>;
    using SubscriptionHandle = uint64_t;

    EventLog(qtils::SharedRef<log::LoggingSystem> logsys,
             qtils::SharedRef<clock::SystemClock> clock);

    EventRecord append(RaffleEvent event);

    /// Records with sequence greater than `after`, oldest first
    std::vector<EventRecord> since(uint64_t after, size_t limit) const;

    size_t size() const;

    SubscriptionHandle subscribe(Listener listener);
    void unsubscribe(SubscriptionHandle handle);

   private:
    log::Logger logger_;
    qtils::SharedRef<clock::SystemClock> clock_;

    mutable std::mutex mutex_;
    std::vector<EventRecord> records_;
    std::map<SubscriptionHandle, Listener> listeners_;
    SubscriptionHandle next_handle_ = 1;
  };

}  // namespace raffle
