#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging (Injected Sinks)
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging for all engine modules.
  - The engine never owns a global logger: hosts pass a LogSink&
    into whatever they construct, and tests capture lines with
    MemorySink.

Hardening:
  - Logging MUST NOT throw (noexcept API). A line the sink cannot
    write (stream failure, allocation) is counted in dropped().
  - Stream sink is thread-safe (coarse mutex), so sections evaluated
    concurrently still produce whole lines.
  - Severity filtering happens in the sink.

===========================================================
*/

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace panelheat {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

const char* level_tag(LogLevel lvl) noexcept;

// Abstract destination for log lines.
class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(LogLevel lvl, const std::string& msg) noexcept = 0;

  void debug(const std::string& msg) noexcept { write(LogLevel::DEBUG, msg); }
  void info(const std::string& msg) noexcept  { write(LogLevel::INFO, msg); }
  void warn(const std::string& msg) noexcept  { write(LogLevel::WARN, msg); }
  void error(const std::string& msg) noexcept { write(LogLevel::ERROR, msg); }

  // Lines lost to a failing destination.
  std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

 protected:
  void note_dropped() noexcept { dropped_.fetch_add(1, std::memory_order_relaxed); }

 private:
  std::atomic<std::size_t> dropped_{0};
};

// Drops everything.
class NullLogSink final : public LogSink {
 public:
  void write(LogLevel, const std::string&) noexcept override {}
};

// Shared no-op sink for callers that do not care about diagnostics.
LogSink& null_log_sink() noexcept;

// Timestamped lines; WARN/ERROR go to `err`, the rest to `out`.
class StreamLogSink final : public LogSink {
 public:
  StreamLogSink(std::ostream& out, std::ostream& err, LogLevel min_level = LogLevel::INFO);

  void write(LogLevel lvl, const std::string& msg) noexcept override;

 private:
  std::ostream& out_;
  std::ostream& err_;
  const LogLevel min_level_;
  std::mutex mu_;
};

// Captures "[LEVEL] message" lines in memory.
class MemorySink final : public LogSink {
 public:
  void write(LogLevel lvl, const std::string& msg) noexcept override;

  std::vector<std::string> lines() const;
  bool contains(const std::string& needle) const;

 private:
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
};

} // namespace panelheat
