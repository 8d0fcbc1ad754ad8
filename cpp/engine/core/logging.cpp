/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <ostream>
#include <utility>

namespace panelheat {

namespace {

// ISO-8601 UTC, second resolution.
void put_utc_now(std::ostream& os) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &now);
#else
  gmtime_r(&now, &utc);
#endif
  os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace

const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::INFO:  break;
  }
  return "INFO";
}

LogSink& null_log_sink() noexcept {
  static NullLogSink shared;
  return shared;
}

StreamLogSink::StreamLogSink(std::ostream& out, std::ostream& err, LogLevel min_level)
    : out_(out), err_(err), min_level_(min_level) {}

void StreamLogSink::write(LogLevel lvl, const std::string& msg) noexcept {
  if (lvl < min_level_) return;

  try {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostream& os = lvl >= LogLevel::WARN ? err_ : out_;
    os << '[';
    put_utc_now(os);
    os << "][" << level_tag(lvl) << "] " << msg << std::endl;
  } catch (const std::exception&) {
    note_dropped();
  }
}

void MemorySink::write(LogLevel lvl, const std::string& msg) noexcept {
  try {
    std::string line = "[";
    line += level_tag(lvl);
    line += "] ";
    line += msg;

    std::lock_guard<std::mutex> lk(mu_);
    lines_.push_back(std::move(line));
  } catch (const std::exception&) {
    note_dropped();
  }
}

std::vector<std::string> MemorySink::lines() const {
  std::lock_guard<std::mutex> lk(mu_);
  return lines_;
}

bool MemorySink::contains(const std::string& needle) const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& l) {
    return l.find(needle) != std::string::npos;
  });
}

} // namespace panelheat
