// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef VECRO_LOG_H
#define VECRO_LOG_H

/**
 * @file log.h
 *
 * The service logging framework.
 *
 * Log lines are sent to a process-wide `LogSink`, which forwards them to zero
 * or more `LogBackend`s. By default a single backend writes to `std::clog`,
 * filtering out anything below the severity named in the `VECRO_ENABLE_CLOG`
 * environment variable (`INFO` if unset).
 *
 * @code
 * VECRO_LOG(INFO) << "listening on " << endpoint;
 * @endcode
 */

#include "vecro/version.h"
#include "absl/types/optional.h"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN

/// Concatenate two pre-processor tokens.
#define VECRO_PP_CONCAT(a, b) a##b

/**
 * Create a unique, or most likely unique identifier.
 *
 * The identifier depends on the line number, making a collision with a
 * variable the caller wants to log unlikely.
 */
#define VECRO_LOGGER_IDENTIFIER VECRO_PP_CONCAT(vecro_log_, __LINE__)

/**
 * The main entry point for the loggers.
 *
 * The for-loop introduces a scope with a single new identifier and checks
 * that the level is enabled before building any stream. For log levels
 * disabled at compile-time the loop body is eliminated entirely.
 */
#define VECRO_LOG_I(level, sink)                                        \
  for (::vecro::Logger<::vecro::LogSink::CompileTimeEnabled(            \
           ::vecro::Severity::level)>                                   \
           VECRO_LOGGER_IDENTIFIER(::vecro::Severity::level, __func__,  \
                                   __FILE__, __LINE__, sink);           \
       VECRO_LOGGER_IDENTIFIER.enabled();                               \
       VECRO_LOGGER_IDENTIFIER.LogTo(sink))                             \
  VECRO_LOGGER_IDENTIFIER.Stream()

// We concatenate `VECRO_LS_` with the literal `level`, because some platforms
// define macros such as `DEBUG`.
/// Log a message with the service logging framework.
#define VECRO_LOG(level) \
  VECRO_LOG_I(VECRO_LS_##level, ::vecro::LogSink::Instance())

#ifndef VECRO_LOGGING_MIN_SEVERITY_ENABLED
#define VECRO_LOGGING_MIN_SEVERITY_ENABLED VECRO_LS_DEBUG
#endif  // VECRO_LOGGING_MIN_SEVERITY_ENABLED

/**
 * The severity levels, modelled after syslog(1).
 *
 * Represented as an `int` because we store the values in `std::atomic<int>`.
 */
enum class Severity : int {
  /// Messages that indicate the code is entering and leaving functions.
  VECRO_LS_TRACE,  // NOLINT(readability-identifier-naming)
  /// Debug messages that should not be present in production.
  VECRO_LS_DEBUG,  // NOLINT(readability-identifier-naming)
  /// Informational messages, such as normal progress.
  VECRO_LS_INFO,  // NOLINT(readability-identifier-naming)
  /// Unusual, but expected conditions.
  VECRO_LS_NOTICE,  // NOLINT(readability-identifier-naming)
  /// An indication of problems, operators may need to take action.
  VECRO_LS_WARNING,  // NOLINT(readability-identifier-naming)
  /// An error has been detected.
  VECRO_LS_ERROR,  // NOLINT(readability-identifier-naming)
  /// The service is in a critical state, such as losing its backing store.
  VECRO_LS_CRITICAL,  // NOLINT(readability-identifier-naming)
  /// The service is at risk of immediate failure.
  VECRO_LS_ALERT,  // NOLINT(readability-identifier-naming)
  /// The service is unusable. VECRO_LOG(FATAL) calls std::abort().
  VECRO_LS_FATAL,  // NOLINT(readability-identifier-naming)
  VECRO_LS_HIGHEST = VECRO_LS_FATAL,  // NOLINT(readability-identifier-naming)
  VECRO_LS_LOWEST = VECRO_LS_TRACE,   // NOLINT(readability-identifier-naming)
  // NOLINTNEXTLINE(readability-identifier-naming)
  VECRO_LS_LOWEST_ENABLED = VECRO_LOGGING_MIN_SEVERITY_ENABLED,
};

/// Convert a human-readable representation to a Severity.
absl::optional<Severity> ParseSeverity(std::string const& name);

/// Streaming operator, writes a human-readable representation.
std::ostream& operator<<(std::ostream& os, Severity x);

/// Represents a single log message.
struct LogRecord {
  Severity severity;
  std::string function;
  std::string filename;
  int lineno;
  std::thread::id thread_id;
  std::chrono::system_clock::time_point timestamp;
  std::string message;
};

/// Default formatting of a LogRecord.
std::ostream& operator<<(std::ostream& os, LogRecord const& rhs);

/// The logging backend interface.
class LogBackend {
 public:
  virtual ~LogBackend() = default;

  virtual void Process(LogRecord const& log_record) = 0;
  virtual void ProcessWithOwnership(LogRecord log_record) = 0;
  virtual void Flush() {}
};

/// A sink to receive log records.
class LogSink {
 public:
  LogSink();

  /// Return true if the severity is enabled at compile time.
  static bool constexpr CompileTimeEnabled(Severity level) {
    return level >= Severity::VECRO_LS_LOWEST_ENABLED;
  }

  /// Return the singleton instance for this application.
  static LogSink& Instance();

  /**
   * Return true if this object has no backends.
   *
   * Uses relaxed loads, missing a few messages while a change of backends
   * propagates to other threads does not affect correctness.
   */
  bool empty() const { return empty_.load(std::memory_order_relaxed); }

  /// Return true if @p severity is enabled.
  bool is_enabled(Severity severity) const {
    auto minimum = minimum_severity_.load(std::memory_order_relaxed);
    return static_cast<int>(severity) >= minimum;
  }

  void set_minimum_severity(Severity minimum) {
    minimum_severity_.store(static_cast<int>(minimum));
  }
  Severity minimum_severity() const {
    return static_cast<Severity>(minimum_severity_.load());
  }

  using BackendId = long;  // NOLINT(google-runtime-int)

  BackendId AddBackend(std::shared_ptr<LogBackend> backend);
  void RemoveBackend(BackendId id);
  void ClearBackends();
  std::size_t BackendCount() const;

  void Log(LogRecord log_record);

  /// Flush all the current backends.
  void Flush();

  /// Enable `std::clog` on `LogSink::Instance()`.
  static void EnableStdClog(
      Severity min_severity = Severity::VECRO_LS_LOWEST_ENABLED) {
    Instance().EnableStdClogImpl(min_severity);
  }

  /// Disable `std::clog` on `LogSink::Instance()`.
  static void DisableStdClog() { Instance().DisableStdClogImpl(); }

 private:
  void EnableStdClogImpl(Severity min_severity);
  void DisableStdClogImpl();
  void SetDefaultBackend(std::shared_ptr<LogBackend> backend);
  BackendId AddBackendImpl(std::shared_ptr<LogBackend> backend);
  void RemoveBackendImpl(BackendId id);

  std::map<BackendId, std::shared_ptr<LogBackend>> CopyBackends();

  std::atomic<bool> empty_;
  std::atomic<int> minimum_severity_;
  std::mutex mutable mu_;
  BackendId next_id_ = 0;
  BackendId default_backend_id_ = 0;
  std::map<BackendId, std::shared_ptr<LogBackend>> backends_;
};

/// Implements operator<< for all types, without any effect.
struct NullStream {
  template <typename T>
  NullStream& operator<<(T) {
    return *this;
  }
};

/**
 * Captures a log message.
 *
 * @tparam CompileTimeEnabled whether the severity is enabled at compile-time.
 *   The class is specialized for `false` to elide disabled logs.
 */
template <bool CompileTimeEnabled>
class Logger {
 public:
  Logger(Severity severity, char const* function, char const* filename,
         int lineno, LogSink& sink)
      : enabled_(!sink.empty() && sink.is_enabled(severity)),
        severity_(severity),
        function_(function),
        filename_(filename),
        lineno_(lineno) {}

  ~Logger() {
    if (severity_ >= Severity::VECRO_LS_FATAL) std::abort();
  }

  bool enabled() const { return enabled_; }

  /// Send the log record captured by this object to @p sink.
  void LogTo(LogSink& sink) {
    if (!stream_ || !enabled_) {
      return;
    }
    enabled_ = false;
    LogRecord record;
    record.severity = severity_;
    record.function = function_;
    record.filename = filename_;
    record.lineno = lineno_;
    record.thread_id = std::this_thread::get_id();
    record.timestamp = std::chrono::system_clock::now();
    record.message = stream_->str();
    sink.Log(std::move(record));
  }

  /// Return the iostream that captures the log message.
  std::ostream& Stream() {
    if (!stream_) stream_ = std::make_unique<std::ostringstream>();
    return *stream_;
  }

 private:
  bool enabled_;
  Severity severity_;
  char const* function_;
  char const* filename_;
  int lineno_;
  std::unique_ptr<std::ostringstream> stream_;
};

/// The logger for a level disabled at compile-time.
template <>
class Logger<false> {
 public:
  Logger(Severity severity, char const*, char const*, int, LogSink&)
      : severity_(severity) {}

  ~Logger() {
    if (severity_ >= Severity::VECRO_LS_FATAL) std::abort();
  }

  // NOLINTNEXTLINE(readability-convert-member-functions-to-static)
  bool enabled() const { return false; }
  void LogTo(LogSink&) {}
  // NOLINTNEXTLINE(readability-convert-member-functions-to-static)
  NullStream Stream() { return NullStream(); }

 private:
  Severity severity_;
};

namespace internal {
std::shared_ptr<LogBackend> DefaultLogBackend();
}  // namespace internal

VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_LOG_H
