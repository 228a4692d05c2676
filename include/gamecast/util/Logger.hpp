// Repository: Gamecast-commentary
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission: prevents multi-thread interleave.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_UTIL_LOGGER_HPP_
#define GAMECAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace gamecast::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes: guaranteeing no interleave between concurrent threads
// (feeder thread, periodic commentary thread, gRPC handlers).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when GAMECAST_DEBUG env is set (per-packet detail)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Used by tests to assert that a
// fault or a skipped source was reported.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only. Call with nullptr to clear.
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace gamecast::util

#endif  // GAMECAST_UTIL_LOGGER_HPP_
