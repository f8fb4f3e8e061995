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

#include "circuits/sha256/message_schedule.h"

#include <stddef.h>
#include <stdint.h>

#include <array>

#include "algebra/fp_pasta.h"
#include "circuits/sha256/sha256_testing.h"
#include "circuits/sha256/spread_table.h"
#include "circuits/sha256/table16_gates.h"
#include "plonk/circuit_shape.h"
#include "plonk/constraint_system.h"
#include "plonk/mock_prover.h"
#include "util/log.h"
#include "gtest/gtest.h"

namespace sha256zk {
namespace {
using Field = FpPallas;
const Field& F = pallas_base;
constexpr size_t kLogRows = 16;

struct ScheduleCircuit {
  BlockWords block;
  ScheduleWords* out;

  static Table16Config configure(ConstraintSystem<Field>& cs) {
    return Table16Gates::configure(cs);
  }

  template <class Layouter>
  void synthesize(const Table16Config& cfg, Layouter& layouter) const {
    SpreadTableChip::load(cfg.lookup, layouter);
    *out = MessageScheduleChip::process(cfg, layouter, block);
  }
};

void check_schedule(const fixtures::Block& m) {
  ScheduleWords w;
  auto p = MockProver<Field>::run(F, kLogRows,
                                  ScheduleCircuit{fixtures::known_block(m), &w});
  EXPECT_TRUE(p->verify().empty());

  std::array<uint32_t, kRounds> want = fixtures::reference_schedule(m);
  for (size_t t = 0; t < kRounds; ++t) {
    EXPECT_EQ(w[t].value().get(), want[t]) << "t=" << t;
    EXPECT_EQ(fixtures::small_value(F, p->cell(w[t].dense.cell)), want[t]);
    EXPECT_EQ(w[t].lo.spread.value.get(), spread16(want[t] & 0xffff));
    EXPECT_EQ(w[t].hi.spread.value.get(), spread16(want[t] >> 16));
  }
}

TEST(MessageSchedule, Abc) {
  set_log_level(ERROR);
  check_schedule(fixtures::pad_message(fixtures::kAbc)[0]);
}

TEST(MessageSchedule, SecondBlock) {
  set_log_level(ERROR);
  check_schedule(fixtures::pad_message(fixtures::kTwoBlock)[1]);
}

TEST(MessageSchedule, AllOnes) {
  set_log_level(ERROR);
  fixtures::Block m;
  m.fill(0xffffffffu);
  check_schedule(m);
}

// Synthesis without a witness places every region where the witness
// pass does.
TEST(MessageSchedule, LayoutWithoutWitness) {
  set_log_level(ERROR);
  ScheduleWords w;
  auto shape = CircuitShape<Field>::run(
      F, kLogRows, ScheduleCircuit{fixtures::unknown_block(), &w});
  ScheduleWords w2;
  auto p = MockProver<Field>::run(
      F, kLogRows,
      ScheduleCircuit{fixtures::known_block(fixtures::Block{}), &w2});
  EXPECT_EQ(shape->rows_used(), p->rows_used());
  EXPECT_EQ(shape->regions().size(), kBlockWords + 3 * (kRounds - kBlockWords));
  EXPECT_FALSE(w[20].value().is_known());
  EXPECT_TRUE(w2[20].value().is_known());
  for (size_t t = 0; t < kRounds; ++t) {
    EXPECT_EQ(w[t].dense.cell.row, w2[t].dense.cell.row);
  }
}

}  // namespace
}  // namespace sha256zk
