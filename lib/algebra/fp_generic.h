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

#ifndef SHA256ZK_LIB_ALGEBRA_FP_GENERIC_H_
#define SHA256ZK_LIB_ALGEBRA_FP_GENERIC_H_

#include <stddef.h>

#include <cstdint>
#include <optional>

#include "algebra/nat.h"
#include "algebra/sysdep.h"
#include "util/panic.h"

namespace sha256zk {

// Prime field Fp for an odd modulus p < 2^(64*W), elements kept in
// Montgomery form x*R mod p with R = 2^(64*W).  Elements are always fully
// reduced, so two elements are equal iff their limbs are equal.
template <size_t W>
class FpGeneric {
 public:
  using N = Nat<W>;
  static constexpr size_t kU64 = W;
  static constexpr size_t kBits = N::kBits;

  struct Elt {
    N n;
    bool operator==(const Elt& y) const { return n == y.n; }
    bool operator!=(const Elt& y) const { return n != y.n; }
  };

  explicit FpGeneric(const N& modulus) : m_(modulus) {
    check(m_.bit(0), "FpGeneric: modulus must be odd");

    // -1/m mod 2^64 by Newton iteration.
    uint64_t inv = 1;
    for (size_t i = 0; i < 6; ++i) {
      inv *= 2 - m_.limb_[0] * inv;
    }
    mprime_ = 0 - inv;

    // R mod m, then R^2 mod m, by repeated doubling.
    N x(1);
    for (size_t i = 0; i < kBits; ++i) double_mod(x);
    k_[0] = Elt{N()};
    k_[1] = Elt{x};
    k_[2] = addf(k_[1], k_[1]);
    for (size_t i = 0; i < kBits; ++i) double_mod(x);
    rsquare_ = x;
  }

  explicit FpGeneric(const char* modulus) : FpGeneric(N(modulus)) {}

  FpGeneric(const FpGeneric&) = delete;
  FpGeneric& operator=(const FpGeneric&) = delete;

  const N& modulus() const { return m_; }

  const Elt& zero() const { return k_[0]; }
  const Elt& one() const { return k_[1]; }
  const Elt& two() const { return k_[2]; }

  Elt of_scalar(uint64_t a) const { return to_montgomery(N(a)); }

  Elt of_string(const char* s) const {
    std::optional<Elt> e = of_untrusted_string(s);
    check(e.has_value(), "FpGeneric: malformed constant");
    return *e;
  }

  std::optional<Elt> of_untrusted_string(const char* s) const {
    std::optional<N> n = N::of_untrusted_string(s);
    if (!n.has_value() || *n >= m_) return std::nullopt;
    return to_montgomery(*n);
  }

  Elt to_montgomery(const N& a) const {
    check(a < m_, "FpGeneric: value not reduced");
    return Elt{mont_mul(a, rsquare_)};
  }

  N from_montgomery(const Elt& e) const { return mont_mul(e.n, N(1)); }

  void add(Elt& a, const Elt& y) const {
    uint64_t carry = a.n.add(y.n);
    if (carry != 0 || a.n >= m_) a.n.sub(m_);
  }

  void sub(Elt& a, const Elt& y) const {
    uint64_t borrow = a.n.sub(y.n);
    if (borrow != 0) a.n.add(m_);
  }

  void mul(Elt& a, const Elt& y) const { a.n = mont_mul(a.n, y.n); }

  void neg(Elt& a) const {
    if (a.n.is_zero()) return;
    N t = m_;
    t.sub(a.n);
    a.n = t;
  }

  Elt addf(Elt a, const Elt& y) const {
    add(a, y);
    return a;
  }
  Elt subf(Elt a, const Elt& y) const {
    sub(a, y);
    return a;
  }
  Elt mulf(Elt a, const Elt& y) const {
    mul(a, y);
    return a;
  }
  Elt negf(Elt a) const {
    neg(a);
    return a;
  }

 private:
  void double_mod(N& x) const {
    uint64_t carry = x.shl1();
    if (carry != 0 || x >= m_) x.sub(m_);
  }

  // Coarsely integrated operand scanning.  Inputs are < m, output < m.
  N mont_mul(const N& a, const N& b) const {
    uint64_t t[W + 2] = {};
    for (size_t i = 0; i < W; ++i) {
      uint64_t carry = 0;
      for (size_t j = 0; j < W; ++j) {
        uint64_t lo, hi;
        mulq(&lo, &hi, a.limb_[j], b.limb_[i]);
        uint64_t c = 0;
        lo = addcq(lo, t[j], &c);
        hi += c;
        c = 0;
        t[j] = addcq(lo, carry, &c);
        carry = hi + c;
      }
      uint64_t c = 0;
      t[W] = addcq(t[W], carry, &c);
      t[W + 1] = c;

      uint64_t u = t[0] * mprime_;
      uint64_t lo, hi;
      mulq(&lo, &hi, u, m_.limb_[0]);
      c = 0;
      addcq(lo, t[0], &c);
      carry = hi + c;
      for (size_t j = 1; j < W; ++j) {
        mulq(&lo, &hi, u, m_.limb_[j]);
        c = 0;
        lo = addcq(lo, t[j], &c);
        hi += c;
        c = 0;
        t[j - 1] = addcq(lo, carry, &c);
        carry = hi + c;
      }
      c = 0;
      t[W - 1] = addcq(t[W], carry, &c);
      t[W] = t[W + 1] + c;
    }

    N r;
    for (size_t j = 0; j < W; ++j) r.limb_[j] = t[j];
    if (t[W] != 0 || r >= m_) r.sub(m_);
    return r;
  }

  N m_;
  uint64_t mprime_;
  N rsquare_;
  Elt k_[3];  // 0, 1, 2
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_ALGEBRA_FP_GENERIC_H_
