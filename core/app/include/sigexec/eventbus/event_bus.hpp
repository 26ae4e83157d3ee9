#pragma once

#include "sigexec/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace sigexec {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe for engine notifications
// (status writes, risk locks, session resets, breakeven moves, tick
// summaries).
//
// Publishers are the Coordinator, RiskManager and ExecutionEngine; they do not
// know who listens. Subscribers are the console logger, the IPC telemetry
// bridge and tests. Nothing in the trading path depends on a subscriber being
// present.
//
// Thread model: subscribe / unsubscribe / publish are safe from any thread.
// Callbacks run synchronously on the publishing thread (the tick thread in
// practice), so a slow subscriber slows the tick; subscribers that do I/O
// hand the event to a queue instead.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked for every published event.
  // @return Id for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked only for events holding EventType,
  //         e.g. subscribe<RiskLockEvent>(...).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // @brief  Stops delivery to the given subscription. An unknown id is
  //         ignored. A publish() already in flight on another thread may
  //         still invoke the callback once.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @brief  Invokes every current subscriber with the event before
  //         returning.
  //
  // @details
  // The subscriber list is copied under the lock and the callbacks run
  // without it, so a callback may itself publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace sigexec
