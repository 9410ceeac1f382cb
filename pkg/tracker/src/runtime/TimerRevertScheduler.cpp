// Repository: BellWatch
// Component: TimerRevertScheduler Implementation
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/TimerRevertScheduler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

#include "bellwatch/util/Logger.hpp"

namespace bellwatch::runtime {

using bellwatch::util::Logger;

namespace {

// Upper bound on a single wait so a wall-clock step backwards cannot park the
// worker far beyond the deadline it computed.
constexpr auto kMaxWaitSlice = std::chrono::milliseconds(1'000);

}  // namespace

TimerRevertScheduler::TimerRevertScheduler(std::shared_ptr<ITimeSource> time_source)
    : time_source_(std::move(time_source)) {
  worker_thread_ = std::thread(&TimerRevertScheduler::WorkerLoop, this);
}

TimerRevertScheduler::~TimerRevertScheduler() {
  Shutdown();
}

void TimerRevertScheduler::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
    queue_.clear();
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

void TimerRevertScheduler::Schedule(const std::string& session_id,
                                    int64_t due_utc_ms,
                                    RevertAction action) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.load(std::memory_order_acquire)) return;
    Entry entry;
    entry.due_utc_ms = due_utc_ms;
    entry.sequence = next_sequence_++;
    entry.session_id = session_id;
    entry.action = std::move(action);
    // Sorted by due time; upper_bound keeps insertion order for ties.
    auto it = std::upper_bound(
        queue_.begin(), queue_.end(), due_utc_ms,
        [](int64_t due, const Entry& e) { return due < e.due_utc_ms; });
    queue_.insert(it, std::move(entry));
  }
  work_cv_.notify_one();
}

void TimerRevertScheduler::CancelSession(const std::string& session_id) {
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = queue_.size();
    queue_.erase(
        std::remove_if(queue_.begin(), queue_.end(),
                       [&session_id](const Entry& e) {
                         return e.session_id == session_id;
                       }),
        queue_.end());
    removed = before - queue_.size();
  }
  work_cv_.notify_one();
  if (removed > 0) {
    std::ostringstream oss;
    oss << "[TimerRevertScheduler] CANCEL session=" << session_id
        << " removed=" << removed;
    Logger::Debug(oss.str());
  }
}

std::size_t TimerRevertScheduler::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void TimerRevertScheduler::WorkerLoop() {
  while (true) {
    std::vector<Entry> due;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });

      if (shutdown_.load(std::memory_order_acquire)) return;

      const int64_t now_ms = time_source_->NowUtcMs();
      const int64_t wait_ms = queue_.front().due_utc_ms - now_ms;
      if (wait_ms > 0) {
        // Woken early by Schedule/CancelSession/Shutdown, or the slice ran out;
        // either way re-evaluate from the top.
        work_cv_.wait_for(lock, std::min<std::chrono::milliseconds>(
                                    std::chrono::milliseconds(wait_ms), kMaxWaitSlice));
        continue;
      }

      auto split = std::find_if(queue_.begin(), queue_.end(),
                                [now_ms](const Entry& e) { return e.due_utc_ms > now_ms; });
      due.assign(std::make_move_iterator(queue_.begin()),
                 std::make_move_iterator(split));
      queue_.erase(queue_.begin(), split);
    }

    for (auto& entry : due) {
      try {
        entry.action();
      } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << "[TimerRevertScheduler] ACTION_FAILED session=" << entry.session_id
            << " what=" << e.what();
        Logger::Error(oss.str());
      }
    }
  }
}

}  // namespace bellwatch::runtime
