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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_BITS_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_BITS_H_

#include <stddef.h>
#include <stdint.h>

#include <vector>

namespace sha256zk {

// Little-endian bit vectors and the spread transform.  The spread of a
// bit string b is the string of twice the length with b[i] at position 2i
// and zero at position 2i+1, so that the integer sum of spreads never
// carries from one bit pair into the next.

// Bits of X, least significant first.  Panics unless X < 2^N, N <= 64.
std::vector<bool> bits_of(uint64_t x, size_t n);

// Inverse of bits_of().  Panics if BITS has more than 64 entries.
uint64_t int_of(const std::vector<bool>& bits);

std::vector<bool> spread(const std::vector<bool>& bits);

// Word-level versions of the same transform.
uint32_t spread16(uint16_t x);
uint64_t spread32(uint32_t x);

// Even (resp. odd) bits of a 32-bit spread-sum, packed into 16 bits.
uint16_t even_bits(uint32_t s);
uint16_t odd_bits(uint32_t s);

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_BITS_H_
