#pragma once
/*
================================================================================
Fragment 1.5 - Core: Deterministic Input Fingerprint
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Stable 64-bit fingerprint of everything that drives one section
    evaluation (section geometry, loads, ventilation, settings), carried on
    every ThermalResult so a report row can be traced back to its inputs.

Encoding rules:
  - Reals: -0.0 folds onto +0.0, any NaN folds onto one quiet-NaN payload.
  - Integers: widened to 64 bits, fed low byte first.
  - Text: byte count first, then the bytes.

FNV-1a, 64-bit. Not a cryptographic digest.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace panelheat {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

class InputFingerprint {
 public:
  InputFingerprint() = default;

  void mix_real(double x);
  void mix_text(std::string_view s);
  void mix_count(uint64_t n) { mix_word(n); }
  void mix_int(int v) { mix_word(static_cast<uint64_t>(static_cast<int64_t>(v))); }
  void mix_flag(bool b) { mix_byte(b ? 1u : 0u); }

  template <class E>
  void mix_enum(E e) {
    static_assert(std::is_enum_v<E>, "mix_enum takes an enum");
    mix_word(static_cast<uint64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  Hash64 finish() const { return Hash64{state_}; }

 private:
  void mix_byte(uint8_t b);
  void mix_word(uint64_t w);

  uint64_t state_ = 14695981039346656037ull;
};

// 16 lowercase hex chars, most significant nibble first.
std::string hash_to_hex(Hash64 h);

}  // namespace panelheat
