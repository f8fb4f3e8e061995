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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_COMPRESSION_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_COMPRESSION_H_

#include <stddef.h>
#include <stdint.h>

#include <array>

#include "circuits/sha256/message_schedule.h"
#include "circuits/sha256/sha256_constants.h"
#include "circuits/sha256/table16_gates.h"

namespace sha256zk {

// Running state of the compression function: the working variables
// a..h and the chaining input they started from, which the digest adds
// back in.
struct Table16State {
  std::array<RoundWord, kStateWords> words;
  std::array<RoundWord, kStateWords> init;
};

using DigestWords = std::array<Word32, kStateWords>;

class CompressionChip {
 public:
  // State seeded with the SHA-256 initialization vector, whose words are
  // pinned to the constant column.
  template <class Layouter>
  static Table16State initialize(const Table16Config& cfg,
                                 Layouter& layouter) {
    Table16State s;
    for (size_t i = 0; i < kStateWords; ++i) {
      s.words[i] = layouter.assign_region("iv", [&](auto& region) {
        return Table16Gates::decompose_constant(region, cfg, kSha256IV[i]);
      });
    }
    s.init = s.words;
    return s;
  }

  // State seeded with the digest of a previous block.
  template <class Layouter>
  static Table16State initialize_from(const Table16Config& cfg,
                                      Layouter& layouter,
                                      const DigestWords& prior) {
    Table16State s;
    for (size_t i = 0; i < kStateWords; ++i) {
      s.words[i] = layouter.assign_region("chaining", [&](auto& region) {
        return Table16Gates::decompose_copy(region, cfg, prior[i]);
      });
    }
    s.init = s.words;
    return s;
  }

  template <class Layouter>
  static Table16State compress(const Table16Config& cfg, Layouter& layouter,
                               const Table16State& state,
                               const ScheduleWords& w) {
    Table16State s = state;
    for (size_t t = 0; t < kRounds; ++t) {
      s = round(cfg, layouter, s, w[t], kSha256K[t]);
    }
    return s;
  }

  // One round:
  //   T1 = h + Sigma1(e) + Ch(e, f, g) + K + W
  //   T2 = Sigma0(a) + Maj(a, b, c)
  //   (a..h) <- (T1 + T2, a, b, c, d + T1, e, f, g)
  // with Ch = (e AND f) + ((NOT e) AND g), the two halves having no bit in
  // common.
  template <class Layouter>
  static Table16State round(const Table16Config& cfg, Layouter& layouter,
                            const Table16State& state, const RoundWord& w,
                            uint32_t k) {
    const RoundWord& a = state.words[0];
    const RoundWord& b = state.words[1];
    const RoundWord& c = state.words[2];
    const RoundWord& d = state.words[3];
    const RoundWord& e = state.words[4];
    const RoundWord& f = state.words[5];
    const RoundWord& g = state.words[6];
    const RoundWord& h = state.words[7];

    DensePair s1 = layouter.assign_region("Sigma1", [&](auto& region) {
      return Table16Gates::rotate_xor(region, cfg, RotateXor::kUpperSigma1, e);
    });
    DensePair ch_p = layouter.assign_region("ch", [&](auto& region) {
      return Table16Gates::spread_sum(region, cfg, SpreadSum::kCh, e, f,
                                      nullptr);
    });
    DensePair ch_q = layouter.assign_region("ch_neg", [&](auto& region) {
      return Table16Gates::spread_sum(region, cfg, SpreadSum::kChNeg, e, g,
                                      nullptr);
    });
    DensePair s0 = layouter.assign_region("Sigma0", [&](auto& region) {
      return Table16Gates::rotate_xor(region, cfg, RotateXor::kUpperSigma0, a);
    });
    DensePair maj = layouter.assign_region("maj", [&](auto& region) {
      return Table16Gates::spread_sum(region, cfg, SpreadSum::kMaj, a, b, &c);
    });

    RoundWord e_new = layouter.assign_region("e_new", [&](auto& region) {
      return Table16Gates::add(
          region, cfg,
          {d.halves(), h.halves(), s1, ch_p, ch_q, w.halves()}, k);
    });
    RoundWord a_new = layouter.assign_region("a_new", [&](auto& region) {
      return Table16Gates::add(
          region, cfg,
          {h.halves(), s1, ch_p, ch_q, w.halves(), s0, maj}, k);
    });

    return Table16State{{a_new, a, b, c, e_new, e, f, g}, state.init};
  }

  // Adds the chaining input back into the final working variables.
  template <class Layouter>
  static DigestWords digest(const Table16Config& cfg, Layouter& layouter,
                            const Table16State& state) {
    DigestWords out;
    for (size_t i = 0; i < kStateWords; ++i) {
      RoundWord r = layouter.assign_region("digest", [&](auto& region) {
        return Table16Gates::add(
            region, cfg, {state.words[i].halves(), state.init[i].halves()},
            0);
      });
      out[i] = r.dense;
    }
    return out;
  }
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_COMPRESSION_H_
