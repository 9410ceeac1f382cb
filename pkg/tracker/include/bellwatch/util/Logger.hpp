// Repository: BellWatch
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by engine, probes and gRPC handlers.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_UTIL_LOGGER_HPP_
#define BELLWATCH_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace bellwatch::util {

// Logger writes whole lines under a single static mutex so that lines from
// the revert scheduler, probe threads and gRPC handlers never interleave.
//
// Info  -> stdout
// Debug -> stdout, only when BELLWATCH_DEBUG is set and not "0"
// Warn  -> stderr (detector failures, rejected input)
// Error -> stderr (export write failures, broken invariants)
//
// Tests may install sinks to capture Info()/Warn()/Error() lines.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace bellwatch::util

#endif  // BELLWATCH_UTIL_LOGGER_HPP_
