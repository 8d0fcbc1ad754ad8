#include "engine/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace panelheat {

namespace {

constexpr uint64_t kFnvPrime = 1099511628211ull;
constexpr uint64_t kQuietNaNBits = 0x7ff8000000000000ull;

uint64_t real_bits(double v) {
  if (std::isnan(v)) return kQuietNaNBits;
  if (v == 0.0) return 0;
  return std::bit_cast<uint64_t>(v);
}

} // namespace

void InputFingerprint::mix_byte(uint8_t b) {
  state_ ^= b;
  state_ *= kFnvPrime;
}

void InputFingerprint::mix_word(uint64_t w) {
  for (int i = 0; i < 8; ++i) mix_byte(static_cast<uint8_t>(w >> (8 * i)));
}

void InputFingerprint::mix_real(double x) { mix_word(real_bits(x)); }

void InputFingerprint::mix_text(std::string_view s) {
  mix_word(s.size());
  for (char c : s) mix_byte(static_cast<uint8_t>(c));
}

std::string hash_to_hex(Hash64 h) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 0; i < 16; ++i) {
    out[15 - i] = kDigits[(h.value >> (4 * i)) & 0xF];
  }
  return out;
}

}  // namespace panelheat
