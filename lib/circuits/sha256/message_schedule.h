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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_MESSAGE_SCHEDULE_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_MESSAGE_SCHEDULE_H_

#include <stddef.h>
#include <stdint.h>

#include <array>

#include "circuits/sha256/sha256_constants.h"
#include "circuits/sha256/table16_gates.h"
#include "plonk/value.h"

namespace sha256zk {

using BlockWords = std::array<Value<uint32_t>, kBlockWords>;
using ScheduleWords = std::array<RoundWord, kRounds>;

// Expands one block into the 64 round words
//   W[t] = sigma1(W[t-2]) + W[t-7] + sigma0(W[t-15]) + W[t-16]
// in increasing t.  Every W[t] is a RoundWord, so the compression
// rounds consume the same lookup rows without splitting it again.
class MessageScheduleChip {
 public:
  template <class Layouter>
  static ScheduleWords process(const Table16Config& cfg, Layouter& layouter,
                               const BlockWords& block) {
    ScheduleWords w;
    for (size_t t = 0; t < kBlockWords; ++t) {
      w[t] = layouter.assign_region("message word", [&](auto& region) {
        return Table16Gates::decompose(region, cfg, block[t]);
      });
    }
    for (size_t t = kBlockWords; t < kRounds; ++t) {
      DensePair s0 = layouter.assign_region("sigma0", [&](auto& region) {
        return Table16Gates::rotate_xor(region, cfg, RotateXor::kLowerSigma0,
                                        w[t - 15]);
      });
      DensePair s1 = layouter.assign_region("sigma1", [&](auto& region) {
        return Table16Gates::rotate_xor(region, cfg, RotateXor::kLowerSigma1,
                                        w[t - 2]);
      });
      w[t] = layouter.assign_region("schedule add", [&](auto& region) {
        return Table16Gates::add(
            region, cfg, {s1, w[t - 7].halves(), s0, w[t - 16].halves()}, 0);
      });
    }
    return w;
  }
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_MESSAGE_SCHEDULE_H_
