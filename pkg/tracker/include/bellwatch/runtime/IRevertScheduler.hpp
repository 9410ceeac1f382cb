// Repository: BellWatch
// Component: Revert Scheduler Interface
// Purpose: Decouple delayed status-revert actions from real time.
//          Production: TimerRevertScheduler (worker thread).
//          Tests: ManualRevertScheduler (fires on explicit AdvanceTo, no sleep).
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_IREVERT_SCHEDULER_HPP_
#define BELLWATCH_RUNTIME_IREVERT_SCHEDULER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace bellwatch::runtime {

using RevertAction = std::function<void()>;

class IRevertScheduler {
 public:
  virtual ~IRevertScheduler() = default;

  // Runs `action` once the time source reaches due_utc_ms. Actions are never
  // invoked with scheduler locks held.
  virtual void Schedule(const std::string& session_id,
                        int64_t due_utc_ms,
                        RevertAction action) = 0;

  // Drops every pending action for the session. An action already running is
  // not interrupted.
  virtual void CancelSession(const std::string& session_id) = 0;

  [[nodiscard]] virtual std::size_t PendingCount() const = 0;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_IREVERT_SCHEDULER_HPP_
