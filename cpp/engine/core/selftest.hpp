#pragma once
// ============================================================================
// Fragment 1.18 - Core: Framework-free Selftest Helpers
// File: cpp/engine/core/selftest.hpp
// ============================================================================
//
// Shared by the *_selftest executables. Each check prints "[ OK ]" or
// "[FAIL]" to stderr; finish() returns the process exit code.
//
// ============================================================================

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"

namespace panelheat::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

// Relative/absolute closeness.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

inline void expect_near(double a, double b, std::string_view msg, double rel = 1e-9, double abs = 1e-12) {
  if (!near(a, b, rel, abs)) {
    fail(msg);
    std::cerr << "  got:      " << a << "\n";
    std::cerr << "  expected: " << b << "\n";
  } else {
    pass(msg);
  }
}

// fn must throw PanelHeatError with the given code.
template <class Fn>
void expect_throws(Fn&& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
  } catch (const PanelHeatError& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception thrown\n";
}

inline int finish(std::string_view suite) {
  if (g_fail_count != 0) {
    std::cerr << "\n" << suite << " failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\n" << suite << ": all selftests passed.\n";
  return 0;
}

}  // namespace panelheat::selftest
