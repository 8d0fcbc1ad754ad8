/*
  Fragment 1.19 - Core Selftest

  Checks:
    - sinks: level filter, WARN/ERROR routed to the error stream,
      a failing stream never throws and the line is counted as dropped
    - input fingerprint: -0.0/+0.0 and NaN payloads collapse, text is
      length-delimited, hex form

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <exception>
#include <ios>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <string>

#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"

namespace panelheat {
namespace {

using namespace panelheat::selftest;

// Accepts nothing: every write fails.
class RejectingBuf : public std::streambuf {};

void test_stream_sink() {
  std::ostringstream out;
  std::ostringstream err;
  StreamLogSink sink(out, err, LogLevel::INFO);

  sink.debug("hidden");
  sink.info("stage: 'A' compliant");
  sink.warn("curves: clamped");

  expect_true(out.str().find("hidden") == std::string::npos, "Stream: below level filtered");
  expect_true(out.str().find("[INFO] stage: 'A' compliant") != std::string::npos, "Stream: INFO to out");
  expect_true(err.str().find("[WARN] curves: clamped") != std::string::npos, "Stream: WARN to err");
  expect_true(out.str().front() == '[' && out.str().find("Z][INFO]") != std::string::npos,
              "Stream: UTC timestamp prefix");
  expect_true(sink.dropped() == 0, "Stream: nothing dropped");
}

void test_failing_stream_never_throws() {
  RejectingBuf buf;
  std::ostream broken(&buf);
  broken.exceptions(std::ios::badbit | std::ios::failbit);
  std::ostringstream out;
  StreamLogSink sink(out, broken, LogLevel::DEBUG);

  bool threw = false;
  try {
    sink.error("ventilation: lost");
  } catch (const std::exception&) {
    threw = true;
  }
  expect_true(!threw, "Stream: failing destination does not throw");
  expect_true(sink.dropped() == 1, "Stream: failed line counted");

  sink.info("still here");
  expect_true(out.str().find("still here") != std::string::npos, "Stream: other stream unaffected");
  expect_true(sink.dropped() == 1, "Stream: successful line not counted");
}

void test_memory_sink() {
  MemorySink sink;
  sink.debug("a");
  sink.error("b");
  expect_true(sink.lines().size() == 2 && sink.lines()[0] == "[DEBUG] a", "Memory: every level kept");
  expect_true(sink.contains("[ERROR] b") && !sink.contains("[INFO]"), "Memory: contains");

  null_log_sink().error("ignored");
  expect_true(null_log_sink().dropped() == 0, "Null: discards silently");
}

void test_fingerprint() {
  InputFingerprint a;
  a.mix_real(0.0);
  InputFingerprint b;
  b.mix_real(-0.0);
  expect_true(a.finish() == b.finish(), "Fingerprint: -0.0 equals +0.0");

  const double quiet = std::nan("");
  const double other = std::nan("7");
  InputFingerprint na;
  na.mix_real(quiet);
  InputFingerprint nb;
  nb.mix_real(other);
  expect_true(na.finish() == nb.finish(), "Fingerprint: NaN payloads collapse");

  InputFingerprint ab;
  ab.mix_text("ab");
  ab.mix_text("c");
  InputFingerprint abc;
  abc.mix_text("a");
  abc.mix_text("bc");
  expect_true(ab.finish() != abc.finish(), "Fingerprint: text is length-delimited");

  InputFingerprint empty;
  expect_true(hash_to_hex(empty.finish()) == "cbf29ce484222325", "Fingerprint: FNV-1a offset basis");
  expect_true(hash_to_hex(Hash64{0x0123456789abcdefull}) == "0123456789abcdef", "Fingerprint: hex order");
}

}  // namespace
}  // namespace panelheat

int main() {
  using namespace panelheat;

  test_stream_sink();
  test_failing_stream_never_throws();
  test_memory_sink();
  test_fingerprint();

  return selftest::finish("core_selftest");
}
