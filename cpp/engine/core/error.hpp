#pragma once
/*
===============================================================================
Fragment 1.9 - Core: Error System (ErrorCode + Exception + Require Macro)
File: cpp/engine/core/error.hpp
===============================================================================

One exception type covers every place malformed data can enter: curve files,
layout CSV, settings and caller-facing layout checks. The thermal core is total
over its documented domain and does not throw.

Codes are grouped by decade and never renumbered; the CLI prints them.
===============================================================================
*/

#include <cstdint>
#include <stdexcept>
#include <string>

namespace panelheat {

enum class ErrorCode : std::uint16_t {
  Ok = 0,

  // 1x: caller input
  InvalidInput = 10,
  InvalidGeometry = 11,
  InvalidEnvironment = 12,
  InvalidConfig = 14,

  // 2x: curve data
  MissingCurveData = 20,

  // 4x: files
  IOError = 40,
  ParseError = 41
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::Ok:                 return "Ok";
    case ErrorCode::InvalidInput:       return "InvalidInput";
    case ErrorCode::InvalidGeometry:    return "InvalidGeometry";
    case ErrorCode::InvalidEnvironment: return "InvalidEnvironment";
    case ErrorCode::InvalidConfig:      return "InvalidConfig";
    case ErrorCode::MissingCurveData:   return "MissingCurveData";
    case ErrorCode::IOError:            return "IOError";
    case ErrorCode::ParseError:         return "ParseError";
  }
  return "Unknown";
}

// Where a PANELHEAT_REQUIRE fired.
struct ErrorSite {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

class PanelHeatError final : public std::runtime_error {
public:
  PanelHeatError(ErrorCode c, const std::string& msg, ErrorSite site = {})
      : std::runtime_error(compose(c, msg, site)), code_(c), msg_(msg), site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return msg_; }
  const ErrorSite& where() const noexcept { return site_; }

private:
  // "[panelheat ParseError(41)] layout.csv:3: ... @ file.cpp:120"
  static std::string compose(ErrorCode c, const std::string& msg, const ErrorSite& site) {
    std::string s = "[panelheat ";
    s += to_string(c);
    s += '(' + std::to_string(static_cast<int>(c)) + ")] ";
    s += msg.empty() ? std::string("<no message>") : msg;
    if (site.file != nullptr && *site.file != '\0') {
      s += " @ ";
      s += site.file;
      s += ':' + std::to_string(site.line);
    }
    return s;
  }

  ErrorCode code_;
  std::string msg_;
  ErrorSite site_;
};

[[noreturn]] inline void fail(ErrorCode code, const std::string& msg, ErrorSite site) {
  throw PanelHeatError(code, msg, site);
}

} // namespace panelheat

#define PANELHEAT_SITE ::panelheat::ErrorSite{__FILE__, __func__, __LINE__}

#define PANELHEAT_REQUIRE(cond, code, msg)              \
  do {                                                  \
    if (!(cond)) {                                      \
      ::panelheat::fail((code), (msg), PANELHEAT_SITE); \
    }                                                   \
  } while (0)
