// Repository: BellWatch
// Component: TimerRevertScheduler
// Purpose: Persistent worker thread that runs revert actions in due-time
//          order (earliest first).
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_TIMER_REVERT_SCHEDULER_HPP_
#define BELLWATCH_RUNTIME_TIMER_REVERT_SCHEDULER_HPP_

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bellwatch/runtime/IRevertScheduler.hpp"
#include "time/ITimeSource.hpp"

namespace bellwatch::runtime {

// TimerRevertScheduler
//
// Pending actions are kept sorted by due time. The worker sleeps on a
// condition variable until the earliest deadline (or until a new, earlier
// action is submitted), pops every due action and runs it with the mutex
// released. Deadlines are read from the injected time source, so a clock
// that jumps forward fires everything that became due.
class TimerRevertScheduler : public IRevertScheduler {
 public:
  explicit TimerRevertScheduler(std::shared_ptr<ITimeSource> time_source);
  ~TimerRevertScheduler() override;

  TimerRevertScheduler(const TimerRevertScheduler&) = delete;
  TimerRevertScheduler& operator=(const TimerRevertScheduler&) = delete;

  void Schedule(const std::string& session_id,
                int64_t due_utc_ms,
                RevertAction action) override;
  void CancelSession(const std::string& session_id) override;
  [[nodiscard]] std::size_t PendingCount() const override;

  // Stops the worker and discards pending actions. Idempotent.
  void Shutdown();

 private:
  struct Entry {
    int64_t due_utc_ms = 0;
    uint64_t sequence = 0;  // FIFO among equal deadlines
    std::string session_id;
    RevertAction action;
  };

  void WorkerLoop();

  std::shared_ptr<ITimeSource> time_source_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::vector<Entry> queue_;
  uint64_t next_sequence_ = 0;
  std::atomic<bool> shutdown_{false};
  std::thread worker_thread_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_TIMER_REVERT_SCHEDULER_HPP_
