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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_TABLE16_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_TABLE16_H_

#include <stddef.h>
#include <stdint.h>

#include <array>

#include "circuits/sha256/compression.h"
#include "circuits/sha256/message_schedule.h"
#include "circuits/sha256/sha256_constants.h"
#include "circuits/sha256/spread_table.h"
#include "circuits/sha256/table16_gates.h"
#include "plonk/constraint_system.h"
#include "util/log.h"

namespace sha256zk {

// SHA-256 compression gadget over a 16-bit spread table.
//
// Usage from an outer circuit:
//
//   configure(cs)                      once per circuit definition
//   load(cfg, layouter)                once per circuit instance
//   s = initialize(cfg, layouter)      or initialize_from(cfg, layouter, d)
//   c = compress(cfg, layouter, s, block)
//   d = digest(cfg, layouter, c.state)
//
// Padding and splitting the message into blocks is the caller's job.
class Table16Chip {
 public:
  struct Compressed {
    Table16State state;
    std::array<Word32, kBlockWords> inputs;  // cells of the block words
  };

  template <class Field>
  static Table16Config configure(ConstraintSystem<Field>& cs) {
    return Table16Gates::configure(cs);
  }

  template <class Layouter>
  static void load(const Table16Config& cfg, Layouter& layouter) {
    SpreadTableChip::load(cfg.lookup, layouter);
  }

  template <class Layouter>
  static Table16State initialize(const Table16Config& cfg,
                                 Layouter& layouter) {
    return CompressionChip::initialize(cfg, layouter);
  }

  template <class Layouter>
  static Table16State initialize_from(const Table16Config& cfg,
                                      Layouter& layouter,
                                      const DigestWords& prior) {
    return CompressionChip::initialize_from(cfg, layouter, prior);
  }

  template <class Layouter>
  static Compressed compress(const Table16Config& cfg, Layouter& layouter,
                             const Table16State& state,
                             const BlockWords& block) {
    size_t row0 = layouter.rows_used();
    ScheduleWords w = MessageScheduleChip::process(cfg, layouter, block);
    Compressed r{CompressionChip::compress(cfg, layouter, state, w), {}};
    for (size_t i = 0; i < kBlockWords; ++i) {
      r.inputs[i] = w[i].dense;
    }
    log(INFO, "compress: rows %zu..%zu\n", row0, layouter.rows_used());
    return r;
  }

  template <class Layouter>
  static DigestWords digest(const Table16Config& cfg, Layouter& layouter,
                            const Table16State& state) {
    return CompressionChip::digest(cfg, layouter, state);
  }

  // Binds the digest words to rows ROW..ROW+7 of the instance column.
  template <class Layouter>
  static void expose_digest(const Table16Config& cfg, Layouter& layouter,
                            const DigestWords& d, size_t row) {
    for (size_t i = 0; i < kStateWords; ++i) {
      layouter.constrain_instance(d[i].cell, cfg.instance, row + i);
    }
  }
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_TABLE16_H_
