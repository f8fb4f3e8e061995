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

#include "circuits/sha256/spread_table.h"

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "algebra/fp_pasta.h"
#include "circuits/sha256/bits.h"
#include "plonk/circuit_shape.h"
#include "plonk/constraint_system.h"
#include "plonk/mock_prover.h"
#include "plonk/value.h"
#include "util/log.h"
#include "gtest/gtest.h"

namespace sha256zk {
namespace {
using Field = FpPallas;
const Field& F = pallas_base;
constexpr size_t kLogRows = 17;

// Loads the table and places one lookup row per entry of DENSE.  Values
// that do not fit in 16 bits are written raw, bypassing assign().
struct SpreadCircuit {
  std::vector<uint32_t> dense;
  bool corrupt_spread = false;

  static SpreadTableConfig configure(ConstraintSystem<Field>& cs) {
    Column tag = cs.advice_column();
    Column dense = cs.advice_column();
    Column spread = cs.advice_column();
    return SpreadTableChip::configure(cs, tag, dense, spread);
  }

  template <class Layouter>
  void synthesize(const SpreadTableConfig& cfg, Layouter& layouter) const {
    SpreadTableChip::load(cfg, layouter);
    layouter.assign_region("rows", [&](auto& region) {
      for (size_t i = 0; i < dense.size(); ++i) {
        uint32_t x = dense[i];
        if (x < kSpreadTableRows && !corrupt_spread) {
          SpreadTableChip::assign(region, cfg, i,
                                  Value<uint16_t>::known(uint16_t(x)));
        } else {
          uint64_t s = corrupt_spread ? spread32(x) + 1 : spread32(x);
          region.assign_advice("tag", cfg.tag, i,
                               Value<uint8_t>::known(kSpreadTags - 1));
          region.assign_advice("dense", cfg.dense, i,
                               Value<uint32_t>::known(x));
          region.assign_advice("spread", cfg.spread, i,
                               Value<uint64_t>::known(s));
        }
      }
    });
  }
};

TEST(SpreadTable, TagClasses) {
  EXPECT_EQ(spread_tag(0), 0);
  EXPECT_EQ(spread_tag(127), 0);
  EXPECT_EQ(spread_tag(128), 1);
  EXPECT_EQ(spread_tag(1023), 1);
  EXPECT_EQ(spread_tag(1024), 2);
  EXPECT_EQ(spread_tag(2047), 2);
  EXPECT_EQ(spread_tag(2048), 3);
  EXPECT_EQ(spread_tag(8191), 3);
  EXPECT_EQ(spread_tag(8192), 4);
  EXPECT_EQ(spread_tag(16383), 4);
  EXPECT_EQ(spread_tag(16384), 5);
  EXPECT_EQ(spread_tag(65535), 5);
  EXPECT_EQ(tag_class_for_bits(7), 0u);
  EXPECT_EQ(tag_class_for_bits(14), 4u);
}

TEST(SpreadTableDeathTest, NoTagClass) {
  EXPECT_DEATH(tag_class_for_bits(12), "no tag class");
}

TEST(SpreadTable, EveryValueLooksUp) {
  set_log_level(ERROR);
  SpreadCircuit c;
  for (uint32_t x = 0; x < kSpreadTableRows; ++x) c.dense.push_back(x);
  auto p = MockProver<Field>::run(F, kLogRows, c);
  EXPECT_TRUE(p->verify().empty());
  EXPECT_EQ(p->rows_used(), kSpreadTableRows);
}

TEST(SpreadTable, TableShape) {
  set_log_level(ERROR);
  auto shape = CircuitShape<Field>::run(F, kLogRows, SpreadCircuit{});
  EXPECT_EQ(shape->table_rows(), kSpreadTableRows);
  EXPECT_EQ(shape->cs().lookups().size(), 1u);
  EXPECT_EQ(shape->cs().num_table_columns(), 3u);
}

TEST(SpreadTable, DenseOverflowFails) {
  set_log_level(ERROR);
  SpreadCircuit c;
  c.dense = {0x1234, 0x10000, 7};
  auto failures = MockProver<Field>::run(F, kLogRows, c)->verify();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].kind, VerifyFailure::kLookup);
  EXPECT_EQ(failures[0].row, 1u);
}

TEST(SpreadTable, WrongSpreadFails) {
  set_log_level(ERROR);
  SpreadCircuit c;
  c.dense = {3, 5};
  c.corrupt_spread = true;
  auto failures = MockProver<Field>::run(F, kLogRows, c)->verify();
  EXPECT_EQ(failures.size(), 2u);
}

}  // namespace
}  // namespace sha256zk
