// Repository: BellWatch
// Component: Session Store
// Purpose: Owns every live SessionState; the only place sessions are added or removed.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_SESSION_STORE_HPP_
#define BELLWATCH_RUNTIME_SESSION_STORE_HPP_

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "bellwatch/runtime/GlobalAggregator.hpp"
#include "bellwatch/runtime/IRevertScheduler.hpp"
#include "bellwatch/runtime/SessionState.hpp"
#include "time/ITimeSource.hpp"

namespace bellwatch::runtime {

// One session per external connection. Map mutation and the matching
// aggregator update happen under the store mutex, so concurrent create/delete
// never leave totals and map size out of step.
class SessionStore {
 public:
  SessionStore(std::shared_ptr<ITimeSource> time_source,
               GlobalAggregator& aggregator,
               IRevertScheduler& scheduler);

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // Zeroed counters, empty history/timeline, idle, not recording.
  std::shared_ptr<SessionState> Create(const std::string& connection_id);

  // nullptr if absent.
  std::shared_ptr<SessionState> Get(const std::string& session_id) const;
  std::shared_ptr<SessionState> FindByConnection(const std::string& connection_id) const;

  // Marks the session closed under its mutex, removes it and cancels its
  // pending reverts. Returns false if the id is unknown (nothing is changed).
  // Must not be called with the session's mutex held.
  bool Delete(const std::string& session_id);

  // All live sessions, in no particular order.
  std::vector<std::shared_ptr<SessionState>> Snapshot() const;

  [[nodiscard]] std::size_t Size() const;

 private:
  std::shared_ptr<ITimeSource> time_source_;
  GlobalAggregator& aggregator_;
  IRevertScheduler& scheduler_;

  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_SESSION_STORE_HPP_
