// Repository: BellWatch
// Component: Synthetic Probe Runner
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/SyntheticProbeRunner.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <vector>

#include "bellwatch/util/Logger.hpp"

namespace bellwatch::runtime {

using bellwatch::util::Logger;

SyntheticProbeRunner::SyntheticProbeRunner(int64_t interval_ms,
                                           double probability,
                                           uint32_t seed,
                                           ProbeFn probe_fn)
    : interval_ms_(interval_ms),
      probability_(probability),
      probe_fn_(std::move(probe_fn)),
      seed_rng_(seed != 0 ? seed : std::random_device{}()) {}

SyntheticProbeRunner::~SyntheticProbeRunner() {
  StopAll();
}

void SyntheticProbeRunner::Start(const std::string& session_id) {
  if (interval_ms_ <= 0) return;

  std::unique_ptr<ProbeState> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = probes_.find(session_id);
    if (it != probes_.end()) {
      {
        std::lock_guard<std::mutex> state_lock(it->second->mutex);
        if (!it->second->exited) return;  // already probing
      }
      // Loop ended on its own; reap it and start fresh.
      finished = std::move(it->second);
      probes_.erase(it);
    }

    auto state = std::make_unique<ProbeState>();
    state->rng.seed(seed_rng_());
    ProbeState* raw = state.get();
    state->thread = std::thread(&SyntheticProbeRunner::ProbeLoop, this, session_id, raw);
    probes_.emplace(session_id, std::move(state));
  }
  Join(std::move(finished));

  std::ostringstream oss;
  oss << "[SyntheticProbeRunner] PROBE_START session=" << session_id
      << " interval_ms=" << interval_ms_ << " probability=" << probability_;
  Logger::Debug(oss.str());
}

void SyntheticProbeRunner::Stop(const std::string& session_id) {
  std::unique_ptr<ProbeState> state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = probes_.find(session_id);
    if (it == probes_.end()) return;
    state = std::move(it->second);
    probes_.erase(it);
  }
  Join(std::move(state));

  std::ostringstream oss;
  oss << "[SyntheticProbeRunner] PROBE_STOP session=" << session_id;
  Logger::Debug(oss.str());
}

void SyntheticProbeRunner::StopAll() {
  std::vector<std::unique_ptr<ProbeState>> states;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, state] : probes_) {
      states.push_back(std::move(state));
    }
    probes_.clear();
  }
  for (auto& state : states) {
    Join(std::move(state));
  }
}

bool SyntheticProbeRunner::IsProbing(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = probes_.find(session_id);
  if (it == probes_.end()) return false;
  std::lock_guard<std::mutex> state_lock(it->second->mutex);
  return !it->second->exited;
}

void SyntheticProbeRunner::Join(std::unique_ptr<ProbeState> state) {
  if (!state) return;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->stop = true;
  }
  state->cv.notify_all();
  if (state->thread.joinable()) {
    state->thread.join();
  }
}

void SyntheticProbeRunner::ProbeLoop(const std::string& session_id, ProbeState* state) {
  std::uniform_real_distribution<double> roll(0.0, 1.0);
  while (true) {
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      if (state->cv.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                             [state] { return state->stop; })) {
        break;
      }
    }

    if (roll(state->rng) >= probability_) continue;

    bool keep_going = false;
    try {
      keep_going = probe_fn_(session_id);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[SyntheticProbeRunner] PROBE_FAILED session=" << session_id
          << " what=" << e.what();
      Logger::Error(oss.str());
    }
    if (!keep_going) break;
  }

  std::lock_guard<std::mutex> lock(state->mutex);
  state->exited = true;
}

}  // namespace bellwatch::runtime
