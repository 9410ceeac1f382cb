// Repository: BellWatch
// Component: Bell Event Bus
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/BellEventBus.hpp"

#include <vector>

namespace bellwatch::runtime {

uint64_t BellEventBus::Subscribe(const std::string& session_id,
                                 EventCallback on_event,
                                 ClosedCallback on_closed) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t token = next_token_++;
  subscribers_.emplace(token, Subscriber{session_id, std::move(on_event), std::move(on_closed)});
  return token;
}

void BellEventBus::Unsubscribe(uint64_t token) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(token);
}

void BellEventBus::Publish(const ApplyResult& result) {
  std::vector<EventCallback> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, sub] : subscribers_) {
      if (sub.session_id == result.session_id && sub.on_event) {
        targets.push_back(sub.on_event);
      }
    }
  }
  for (const auto& cb : targets) {
    cb(result);
  }
}

void BellEventBus::CloseSession(const std::string& session_id) {
  std::vector<ClosedCallback> closed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
      if (it->second.session_id == session_id) {
        if (it->second.on_closed) closed.push_back(std::move(it->second.on_closed));
        it = subscribers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& cb : closed) {
    cb();
  }
}

std::size_t BellEventBus::SubscriberCount(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [token, sub] : subscribers_) {
    if (sub.session_id == session_id) ++count;
  }
  return count;
}

}  // namespace bellwatch::runtime
