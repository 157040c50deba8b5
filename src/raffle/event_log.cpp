/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/event_log.hpp"

#include <algorithm>

#include "clock/clock.hpp"

namespace raffle {

  EventLog::EventLog(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<clock::SystemClock> clock)
      : logger_{logsys->getLogger("EventLog", "raffle")},
        clock_{std::move(clock)} {}

  EventRecord EventLog::append(RaffleEvent event) {
    std::vector<Listener> listeners;
    EventRecord record;
    {
      std::lock_guard lock{mutex_};
      record = records_.emplace_back(EventRecord{
          .sequence = records_.size() + 1,
          .timestamp = clock_->now(),
          .event = std::move(event),
      });
      listeners.reserve(listeners_.size());
      for (auto &[_, listener] : listeners_) {
        listeners.emplace_back(listener);
      }
    }
    SL_TRACE(logger_,
             "Event #{} {} appended",
             record.sequence,
             eventName(record.event));
    for (auto &listener : listeners) {
      listener(record);
    }
    return record;
  }

  std::vector<EventRecord> EventLog::since(uint64_t after,
                                           size_t limit) const {
    std::lock_guard lock{mutex_};
    std::vector<EventRecord> result;
    if (after >= records_.size()) {
      return result;
    }
    auto count = std::min<size_t>(records_.size() - after, limit);
    auto begin = records_.begin() + static_cast<ptrdiff_t>(after);
    result.assign(begin, begin + static_cast<ptrdiff_t>(count));
    return result;
  }

  size_t EventLog::size() const {
    std::lock_guard lock{mutex_};
    return records_.size();
  }

  EventLog::SubscriptionHandle EventLog::subscribe(Listener listener) {
    std::lock_guard lock{mutex_};
    auto handle = next_handle_++;
    listeners_.emplace(handle, std::move(listener));
    return handle;
  }

  void EventLog::unsubscribe(SubscriptionHandle handle) {
    std::lock_guard lock{mutex_};
    listeners_.erase(handle);
  }

}  // namespace raffle
