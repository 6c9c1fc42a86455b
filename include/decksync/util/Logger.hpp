// Repository: DeckSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the dispatch thread and gRPC handlers.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_UTIL_LOGGER_HPP_
#define DECKSYNC_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace decksync::util {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

const char* ToString(LogLevel level);

// One line per call, written and flushed under a single static mutex so the
// dispatch thread, the subscription reader and gRPC handler threads never
// interleave. Debug and Info go to stdout, Warn and Error to stderr. Debug
// lines are dropped unless DECKSYNC_DEBUG is set when the process first logs.
//
// Lines follow "[Component] EVENT key=value ...".
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line) { Log(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Log(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Log(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Log(LogLevel::kError, line); }

  static void Log(LogLevel level, const std::string& line);

  // Test hook: sees every emitted line in addition to the stream.
  // Pass nullptr to clear.
  static void SetSink(Sink sink);

  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static Sink sink_;
};

}  // namespace decksync::util

#endif  // DECKSYNC_UTIL_LOGGER_HPP_
