// Copyright 2026 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SHA256ZK_LIB_ALGEBRA_NAT_H_
#define SHA256ZK_LIB_ALGEBRA_NAT_H_

#include <stddef.h>

#include <array>
#include <cstdint>
#include <optional>

#include "algebra/sysdep.h"
#include "util/panic.h"

namespace sha256zk {

// Fixed-width natural number of W 64-bit limbs, little endian.
template <size_t W>
struct Nat {
  static constexpr size_t kU64 = W;
  static constexpr size_t kBits = 64 * W;

  std::array<uint64_t, W> limb_;

  Nat() : limb_{} {}
  explicit Nat(uint64_t x) : limb_{} { limb_[0] = x; }

  // Trusted parser for constants compiled into the program.
  explicit Nat(const char* s) : limb_{} {
    std::optional<Nat> n = of_untrusted_string(s);
    check(n.has_value(), "Nat: malformed constant");
    *this = *n;
  }

  // Accepts decimal or 0x-prefixed hex.  Returns nullopt on an empty
  // string, an invalid digit, or overflow of kBits.
  static std::optional<Nat> of_untrusted_string(const char* s) {
    if (s == nullptr || *s == 0) return std::nullopt;
    uint64_t base = 10;
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      base = 16;
      s += 2;
      if (*s == 0) return std::nullopt;
    }
    Nat r;
    for (; *s; ++s) {
      uint64_t d;
      char c = *s;
      if (c >= '0' && c <= '9') {
        d = c - '0';
      } else if (base == 16 && c >= 'a' && c <= 'f') {
        d = c - 'a' + 10;
      } else if (base == 16 && c >= 'A' && c <= 'F') {
        d = c - 'A' + 10;
      } else {
        return std::nullopt;
      }
      if (d >= base) return std::nullopt;
      if (r.mul_add_small(base, d) != 0) return std::nullopt;
    }
    return r;
  }

  bool bit(size_t i) const {
    if (i >= kBits) return false;
    return (limb_[i / 64] >> (i % 64)) & 1u;
  }

  bool is_zero() const {
    for (size_t i = 0; i < W; ++i) {
      if (limb_[i] != 0) return false;
    }
    return true;
  }

  // this = this * m + a, returns the limb shifted out.
  uint64_t mul_add_small(uint64_t m, uint64_t a) {
    uint64_t carry = a;
    for (size_t i = 0; i < W; ++i) {
      uint64_t lo, hi;
      mulq(&lo, &hi, limb_[i], m);
      uint64_t c = 0;
      limb_[i] = addcq(lo, carry, &c);
      carry = hi + c;
    }
    return carry;
  }

  uint64_t add(const Nat& y) { return accum(W, limb_.data(), W, y.limb_.data()); }

  uint64_t sub(const Nat& y) {
    return negaccum(W, limb_.data(), W, y.limb_.data());
  }

  // Doubles in place, returns the bit shifted out.
  uint64_t shl1() {
    uint64_t out = 0;
    for (size_t i = 0; i < W; ++i) {
      uint64_t next = limb_[i] >> 63;
      limb_[i] = (limb_[i] << 1) | out;
      out = next;
    }
    return out;
  }

  bool operator==(const Nat& y) const { return limb_ == y.limb_; }
  bool operator!=(const Nat& y) const { return !(*this == y); }
  bool operator<(const Nat& y) const {
    for (size_t i = W; i-- > 0;) {
      if (limb_[i] != y.limb_[i]) return limb_[i] < y.limb_[i];
    }
    return false;
  }
  bool operator>=(const Nat& y) const { return !(*this < y); }
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_ALGEBRA_NAT_H_
