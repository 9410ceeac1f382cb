// Repository: BellWatch
// Component: Synthetic Probe Runner
// Purpose: Periodic synthetic detection attempts for recording sessions.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_SYNTHETIC_PROBE_RUNNER_HPP_
#define BELLWATCH_RUNTIME_SYNTHETIC_PROBE_RUNNER_HPP_

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>

namespace bellwatch::runtime {

// One thread per probing session. Every interval_ms the thread rolls against
// `probability`; on a hit it calls probe_fn(session_id). probe_fn returns
// false when the session should no longer be probed (gone or not recording),
// which ends the loop without anyone having to call Stop().
class SyntheticProbeRunner {
 public:
  using ProbeFn = std::function<bool(const std::string& session_id)>;

  SyntheticProbeRunner(int64_t interval_ms, double probability, uint32_t seed, ProbeFn probe_fn);
  ~SyntheticProbeRunner();

  SyntheticProbeRunner(const SyntheticProbeRunner&) = delete;
  SyntheticProbeRunner& operator=(const SyntheticProbeRunner&) = delete;

  // No-op if already probing or if the interval is 0.
  void Start(const std::string& session_id);
  // Blocks until the probe thread has exited. Must not be called from probe_fn.
  void Stop(const std::string& session_id);
  void StopAll();

  [[nodiscard]] bool IsProbing(const std::string& session_id) const;

 private:
  struct ProbeState {
    std::thread thread;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop = false;
    bool exited = false;
    std::mt19937 rng;
  };

  void ProbeLoop(const std::string& session_id, ProbeState* state);
  static void Join(std::unique_ptr<ProbeState> state);

  int64_t interval_ms_;
  double probability_;
  ProbeFn probe_fn_;

  mutable std::mutex mutex_;
  std::mt19937 seed_rng_;
  std::unordered_map<std::string, std::unique_ptr<ProbeState>> probes_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_SYNTHETIC_PROBE_RUNNER_HPP_
