// Repository: BellWatch
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by engine, probes and gRPC handlers.
// Copyright (c) 2026 BellWatch

#include "bellwatch/util/Logger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace bellwatch::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

bool Logger::DebugEnabled() {
  const char* v = std::getenv("BELLWATCH_DEBUG");
  return v != nullptr && *v != '\0' && std::strcmp(v, "0") != 0;
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace bellwatch::util
