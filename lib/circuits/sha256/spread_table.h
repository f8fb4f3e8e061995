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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_SPREAD_TABLE_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_SPREAD_TABLE_H_

#include <stddef.h>
#include <stdint.h>

#include "circuits/sha256/bits.h"
#include "plonk/circuit.h"
#include "plonk/constraint_system.h"
#include "plonk/value.h"
#include "util/log.h"
#include "util/panic.h"

namespace sha256zk {

constexpr size_t kSpreadTableBits = 16;
constexpr size_t kSpreadTableRows = size_t(1) << kSpreadTableBits;

// Number of tag classes.  The tag of a dense value is the index of the
// first class bound it falls under, so a lookup row whose tag is at most
// c proves that the dense value has at most kTagBits[c] bits.
constexpr size_t kSpreadTags = 6;
constexpr size_t kTagBits[kSpreadTags] = {7, 10, 11, 13, 14, 16};

inline uint8_t spread_tag(uint16_t dense) {
  for (size_t c = 0; c + 1 < kSpreadTags; ++c) {
    if ((uint32_t(dense) >> kTagBits[c]) == 0) return static_cast<uint8_t>(c);
  }
  return static_cast<uint8_t>(kSpreadTags - 1);
}

// Tag class that bounds a piece of BITS bits.  Panics unless BITS is one
// of the class bounds.
inline size_t tag_class_for_bits(size_t bits) {
  for (size_t c = 0; c < kSpreadTags; ++c) {
    if (kTagBits[c] == bits) return c;
  }
  fail("tag_class_for_bits(): no tag class for this piece length");
}

// Assigned lookup row: a 16-bit dense value, its spread and its tag.
struct SpreadVar {
  AssignedCell<uint8_t> tag;
  AssignedCell<uint16_t> dense;
  AssignedCell<uint32_t> spread;
};

struct SpreadTableConfig {
  // advice inputs, looked up on every row
  Column tag, dense, spread;
  TableColumn table_tag, table_dense, table_spread;
};

// The table of all (tag, x, spread(x)) for 16-bit x.  There is no lookup
// selector: the triple in the three input columns is looked up on every
// row, and rows that do not use them hold (0, 0, 0), which is the first
// row of the table.
class SpreadTableChip {
 public:
  template <class Field>
  static SpreadTableConfig configure(ConstraintSystem<Field>& cs,
                                     const Column& tag, const Column& dense,
                                     const Column& spread) {
    SpreadTableConfig cfg{tag,
                          dense,
                          spread,
                          cs.lookup_table_column(),
                          cs.lookup_table_column(),
                          cs.lookup_table_column()};
    cs.lookup("spread", {{cs.query_advice(tag, 0), cfg.table_tag},
                         {cs.query_advice(dense, 0), cfg.table_dense},
                         {cs.query_advice(spread, 0), cfg.table_spread}});
    return cfg;
  }

  template <class Layouter>
  static void load(const SpreadTableConfig& cfg, Layouter& layouter) {
    layouter.assign_table("spread table", [&](auto& table) {
      for (size_t i = 0; i < kSpreadTableRows; ++i) {
        uint16_t x = static_cast<uint16_t>(i);
        table.assign_cell("tag", cfg.table_tag, i,
                          Value<uint8_t>::known(spread_tag(x)));
        table.assign_cell("dense", cfg.table_dense, i,
                          Value<uint16_t>::known(x));
        table.assign_cell("spread", cfg.table_spread, i,
                          Value<uint32_t>::known(spread16(x)));
      }
    });
    log(INFO, "spread table: %zu rows\n", kSpreadTableRows);
  }

  // Assigns the lookup row for DENSE at OFFSET of REGION.
  template <class Region>
  static SpreadVar assign(Region& region, const SpreadTableConfig& cfg,
                          size_t offset, const Value<uint16_t>& dense) {
    return SpreadVar{
        region.assign_advice("tag", cfg.tag, offset, dense.map(spread_tag)),
        region.assign_advice("dense", cfg.dense, offset, dense),
        region.assign_advice("spread", cfg.spread, offset,
                             dense.map(spread16))};
  }
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_SPREAD_TABLE_H_
