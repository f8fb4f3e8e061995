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

#ifndef SHA256ZK_LIB_ALGEBRA_SYSDEP_H_
#define SHA256ZK_LIB_ALGEBRA_SYSDEP_H_

#include <cstddef>
#include <cstdint>

namespace sha256zk {

// Double-word product of two limbs.
static inline void mulq(uint64_t* lo, uint64_t* hi, uint64_t a, uint64_t b) {
  unsigned __int128 p = static_cast<unsigned __int128>(a) * b;
  *lo = static_cast<uint64_t>(p);
  *hi = static_cast<uint64_t>(p >> 64);
}

// a += b + *carry, updating *carry.
static inline uint64_t addcq(uint64_t a, uint64_t b, uint64_t* carry) {
  unsigned __int128 s = static_cast<unsigned __int128>(a) + b + *carry;
  *carry = static_cast<uint64_t>(s >> 64);
  return static_cast<uint64_t>(s);
}

// a -= b + *borrow, updating *borrow.
static inline uint64_t subbq(uint64_t a, uint64_t b, uint64_t* borrow) {
  unsigned __int128 d = static_cast<unsigned __int128>(a) - b - *borrow;
  *borrow = static_cast<uint64_t>(d >> 64) & 1u;
  return static_cast<uint64_t>(d);
}

// A[0,n) += B[0,m), m <= n.  Returns the carry out of the top limb.
static inline uint64_t accum(size_t n, uint64_t a[], size_t m,
                             const uint64_t b[]) {
  uint64_t c = 0;
  for (size_t i = 0; i < m; ++i) a[i] = addcq(a[i], b[i], &c);
  for (size_t i = m; i < n; ++i) a[i] = addcq(a[i], 0, &c);
  return c;
}

// A[0,n) -= B[0,m), m <= n.  Returns the borrow out of the top limb.
static inline uint64_t negaccum(size_t n, uint64_t a[], size_t m,
                                const uint64_t b[]) {
  uint64_t c = 0;
  for (size_t i = 0; i < m; ++i) a[i] = subbq(a[i], b[i], &c);
  for (size_t i = m; i < n; ++i) a[i] = subbq(a[i], 0, &c);
  return c;
}

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_ALGEBRA_SYSDEP_H_
