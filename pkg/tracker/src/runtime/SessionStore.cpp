// Repository: BellWatch
// Component: Session Store
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/SessionStore.hpp"

#include "bellwatch/util/Uuid.hpp"

namespace bellwatch::runtime {

SessionStore::SessionStore(std::shared_ptr<ITimeSource> time_source,
                           GlobalAggregator& aggregator,
                           IRevertScheduler& scheduler)
    : time_source_(std::move(time_source)),
      aggregator_(aggregator),
      scheduler_(scheduler) {}

std::shared_ptr<SessionState> SessionStore::Create(const std::string& connection_id) {
  auto session = std::make_shared<SessionState>(
      util::GenerateUuidV4(), connection_id, time_source_->NowUtcMs());

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.emplace(session->id, session);
  aggregator_.OnSessionCreated();
  return session;
}

std::shared_ptr<SessionState> SessionStore::Get(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<SessionState> SessionStore::FindByConnection(
    const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  for (const auto& [id, session] : sessions_) {
    if (session->connection_id == connection_id) {
      return session;
    }
  }
  return nullptr;
}

bool SessionStore::Delete(const std::string& session_id) {
  auto session = Get(session_id);
  if (!session) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed) {
      return false;  // lost a concurrent Delete
    }
    session->closed = true;
  }
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second == session) {
      sessions_.erase(it);
    }
    aggregator_.OnSessionDeleted();
  }
  scheduler_.CancelSession(session_id);
  return true;
}

std::vector<std::shared_ptr<SessionState>> SessionStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  std::vector<std::shared_ptr<SessionState>> out;
  out.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) {
    out.push_back(session);
  }
  return out;
}

std::size_t SessionStore::Size() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

}  // namespace bellwatch::runtime
