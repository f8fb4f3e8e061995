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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_SHA256_TESTING_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_SHA256_TESTING_H_

// Fixtures for the gadget tests: message padding and a plain-integer
// model of the schedule and compression function to compare circuit
// values against.  Test-only.

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "circuits/sha256/message_schedule.h"
#include "circuits/sha256/sha256_constants.h"
#include "plonk/value.h"
#include "util/panic.h"

namespace sha256zk {
namespace fixtures {

using Block = std::array<uint32_t, kBlockWords>;
using State = std::array<uint32_t, kStateWords>;

constexpr char kAbc[] = "abc";
constexpr char kTwoBlock[] =
    "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

constexpr State kAbcDigest = {0xba7816bf, 0x8f01cfea, 0x414140de,
                              0x5dae2223, 0xb00361a3, 0x96177a9c,
                              0xb410ff61, 0xf20015ad};
constexpr State kTwoBlockDigest = {0x248d6a61, 0xd20638b8, 0xe5c02693,
                                   0x0c3e6039, 0xa33ce459, 0x64ff2167,
                                   0xf6ecedd4, 0x19db06c1};

inline uint32_t rotr(uint32_t x, size_t n) {
  return (x >> n) | (x << ((32 - n) % 32));
}

// FIPS 180-4 padding into big-endian 32-bit words.
inline std::vector<Block> pad_message(const std::string& msg) {
  std::vector<uint8_t> bytes(msg.begin(), msg.end());
  uint64_t nbits = uint64_t(bytes.size()) * 8;
  bytes.push_back(0x80);
  while (bytes.size() % 64 != 56) bytes.push_back(0);
  for (int i = 7; i >= 0; --i) bytes.push_back(uint8_t(nbits >> (8 * i)));

  std::vector<Block> blocks(bytes.size() / 64);
  for (size_t i = 0; i < bytes.size(); i += 4) {
    blocks[i / 64][(i % 64) / 4] =
        (uint32_t(bytes[i]) << 24) | (uint32_t(bytes[i + 1]) << 16) |
        (uint32_t(bytes[i + 2]) << 8) | uint32_t(bytes[i + 3]);
  }
  return blocks;
}

inline std::array<uint32_t, kRounds> reference_schedule(const Block& m) {
  std::array<uint32_t, kRounds> w;
  for (size_t t = 0; t < kRounds; ++t) {
    if (t < kBlockWords) {
      w[t] = m[t];
    } else {
      uint32_t x = w[t - 15], y = w[t - 2];
      uint32_t s0 = rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3);
      uint32_t s1 = rotr(y, 17) ^ rotr(y, 19) ^ (y >> 10);
      w[t] = s1 + w[t - 7] + s0 + w[t - 16];
    }
  }
  return w;
}

// Working variables after 64 rounds, without the final addition.
inline State reference_rounds(const State& init, const Block& m) {
  std::array<uint32_t, kRounds> w = reference_schedule(m);
  State v = init;
  for (size_t t = 0; t < kRounds; ++t) {
    uint32_t a = v[0], b = v[1], c = v[2], d = v[3];
    uint32_t e = v[4], f = v[5], g = v[6], h = v[7];
    uint32_t s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
    uint32_t ch = (e & f) ^ (~e & g);
    uint32_t t1 = h + s1 + ch + kSha256K[t] + w[t];
    uint32_t s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
    uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
    v = State{t1 + s0 + maj, a, b, c, d + t1, e, f, g};
  }
  return v;
}

inline State reference_compress(const State& init, const Block& m) {
  State v = reference_rounds(init, m);
  for (size_t i = 0; i < kStateWords; ++i) v[i] += init[i];
  return v;
}

inline State iv() {
  State s;
  for (size_t i = 0; i < kStateWords; ++i) s[i] = kSha256IV[i];
  return s;
}

inline BlockWords known_block(const Block& m) {
  BlockWords r;
  for (size_t i = 0; i < kBlockWords; ++i) {
    r[i] = Value<uint32_t>::known(m[i]);
  }
  return r;
}

inline BlockWords unknown_block() {
  BlockWords r;
  for (auto& v : r) v = Value<uint32_t>::unknown();
  return r;
}

// Integer value of a field element known to be below 2^64.
template <class Field>
uint64_t small_value(const Field& F, const std::optional<typename Field::Elt>& e) {
  check(e.has_value(), "small_value(): cell not assigned");
  auto n = F.from_montgomery(*e);
  for (size_t i = 1; i < n.limb_.size(); ++i) {
    check(n.limb_[i] == 0, "small_value(): value too large");
  }
  return n.limb_[0];
}

}  // namespace fixtures
}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_SHA256_TESTING_H_
