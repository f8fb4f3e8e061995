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

#include "circuits/sha256/bits.h"

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "util/panic.h"

namespace sha256zk {

std::vector<bool> bits_of(uint64_t x, size_t n) {
  check(n <= 64, "bits_of(): more than 64 bits");
  check(n == 64 || (x >> n) == 0, "bits_of(): value does not fit");
  std::vector<bool> r(n);
  for (size_t i = 0; i < n; ++i) {
    r[i] = (x >> i) & 1;
  }
  return r;
}

uint64_t int_of(const std::vector<bool>& bits) {
  check(bits.size() <= 64, "int_of(): more than 64 bits");
  uint64_t r = 0;
  for (size_t i = bits.size(); i-- > 0;) {
    r = (r << 1) | (bits[i] ? 1 : 0);
  }
  return r;
}

std::vector<bool> spread(const std::vector<bool>& bits) {
  std::vector<bool> r(2 * bits.size(), false);
  for (size_t i = 0; i < bits.size(); ++i) {
    r[2 * i] = bits[i];
  }
  return r;
}

uint32_t spread16(uint16_t x) {
  uint32_t r = x;
  r = (r | (r << 8)) & 0x00ff00ffu;
  r = (r | (r << 4)) & 0x0f0f0f0fu;
  r = (r | (r << 2)) & 0x33333333u;
  r = (r | (r << 1)) & 0x55555555u;
  return r;
}

uint64_t spread32(uint32_t x) {
  return uint64_t(spread16(x & 0xffff)) |
         (uint64_t(spread16(x >> 16)) << 32);
}

uint16_t even_bits(uint32_t s) {
  s &= 0x55555555u;
  s = (s | (s >> 1)) & 0x33333333u;
  s = (s | (s >> 2)) & 0x0f0f0f0fu;
  s = (s | (s >> 4)) & 0x00ff00ffu;
  s = (s | (s >> 8)) & 0x0000ffffu;
  return static_cast<uint16_t>(s);
}

uint16_t odd_bits(uint32_t s) { return even_bits(s >> 1); }

}  // namespace sha256zk
