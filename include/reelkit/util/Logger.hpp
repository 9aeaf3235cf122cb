// Repository: Reelkit-playlist
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents multi-thread interleave.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_UTIL_LOGGER_HPP_
#define REELKIT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace reelkit::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, guaranteeing no interleave between concurrent threads
// (event loop, image fetch worker, renderer decode threads, gRPC handlers).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when REELKIT_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (violations, bugs, hard faults)
//
// Test-only: SetErrorSink / SetInfoSink install a callback invoked for every
// Error() / Info() line (in addition to the stream).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // True when REELKIT_DEBUG is set.  Read once per process.
  static bool DebugEnabled();

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

// LogLine builds one structured line:
//   [Component] EVENT key=value key=value
// Usage:
//   Logger::Info(LogLine("BufferWindowManager", "WINDOW_SHIFT")
//                    .Kv("diff", diff).Kv("rebinds", n).Str());
class LogLine {
 public:
  LogLine(const char* component, const char* event) {
    oss_ << "[" << component << "] " << event;
  }

  template <typename T>
  LogLine& Kv(const char* key, const T& value) {
    oss_ << " " << key << "=" << value;
    return *this;
  }

  LogLine& Kv(const char* key, bool value) {
    oss_ << " " << key << "=" << (value ? "true" : "false");
    return *this;
  }

  std::string Str() const { return oss_.str(); }

 private:
  std::ostringstream oss_;
};

}  // namespace reelkit::util

#endif  // REELKIT_UTIL_LOGGER_HPP_
