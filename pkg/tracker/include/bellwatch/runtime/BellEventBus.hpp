// Repository: BellWatch
// Component: Bell Event Bus
// Purpose: Per-session publish channel for applied bell events.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_BELL_EVENT_BUS_HPP_
#define BELLWATCH_RUNTIME_BELL_EVENT_BUS_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::runtime {

// Callbacks run on the publishing thread (an ingest caller or a probe
// thread) with no bus lock held; they should copy and hand off.
class BellEventBus {
 public:
  using EventCallback = std::function<void(const ApplyResult&)>;
  using ClosedCallback = std::function<void()>;

  BellEventBus() = default;

  BellEventBus(const BellEventBus&) = delete;
  BellEventBus& operator=(const BellEventBus&) = delete;

  // Returns a token (never 0) for Unsubscribe.
  uint64_t Subscribe(const std::string& session_id,
                     EventCallback on_event,
                     ClosedCallback on_closed = nullptr);
  void Unsubscribe(uint64_t token);

  void Publish(const ApplyResult& result);

  // Session went away: removes its subscribers and runs their on_closed.
  void CloseSession(const std::string& session_id);

  [[nodiscard]] std::size_t SubscriberCount(const std::string& session_id) const;

 private:
  struct Subscriber {
    std::string session_id;
    EventCallback on_event;
    ClosedCallback on_closed;
  };

  mutable std::mutex mutex_;
  uint64_t next_token_ = 1;
  std::map<uint64_t, Subscriber> subscribers_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_BELL_EVENT_BUS_HPP_
