// Repository: DeckSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the dispatch thread and gRPC handlers.
// Copyright (c) 2025 DeckSync

#include "decksync/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace decksync::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("DECKSYNC_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Log(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace decksync::util
