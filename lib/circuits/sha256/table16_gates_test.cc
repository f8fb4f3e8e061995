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

#include "circuits/sha256/table16_gates.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include "algebra/fp_pasta.h"
#include "circuits/sha256/sha256_testing.h"
#include "circuits/sha256/spread_table.h"
#include "plonk/constraint_system.h"
#include "plonk/layouter.h"
#include "plonk/mock_prover.h"
#include "plonk/value.h"
#include "util/log.h"
#include "gtest/gtest.h"

namespace sha256zk {
namespace {
using Field = FpPallas;
const Field& F = pallas_base;
using Prover = MockProver<Field>;
using L = Layouter<Prover>;
constexpr size_t kLogRows = 16;

struct GateCircuit {
  std::function<void(const Table16Config&, L&)> body;

  static Table16Config configure(ConstraintSystem<Field>& cs) {
    return Table16Gates::configure(cs);
  }

  void synthesize(const Table16Config& cfg, L& layouter) const {
    SpreadTableChip::load(cfg.lookup, layouter);
    body(cfg, layouter);
  }
};

RoundWord word(const Table16Config& cfg, L& layouter, uint32_t x) {
  return layouter.assign_region("word", [&](auto& region) {
    return Table16Gates::decompose(region, cfg, Value<uint32_t>::known(x));
  });
}

uint32_t value_of(const Prover& p, const DensePair& d) {
  uint64_t lo = fixtures::small_value(F, p.cell(d.lo.cell));
  uint64_t hi = fixtures::small_value(F, p.cell(d.hi.cell));
  return uint32_t(lo | (hi << 16));
}

bool has_failure(const std::vector<VerifyFailure>& failures,
                 const std::string& name) {
  return std::any_of(
      failures.begin(), failures.end(),
      [&name](const VerifyFailure& f) { return f.name == name; });
}

const uint32_t kInputs[] = {0u,         1u,         0x80000000u, 0xffffffffu,
                            0x6a09e667u, 0xdeadbeefu, 0x12345678u, 0x0f0f0f0fu};

class Table16GatesTest : public ::testing::Test {
 protected:
  void SetUp() override { set_log_level(ERROR); }
};

TEST_F(Table16GatesTest, Configure) {
  ConstraintSystem<Field> cs(F);
  Table16Config cfg = Table16Gates::configure(cs);
  EXPECT_EQ(cs.num_advice_columns(), 3 + kGeneralAdvice);
  EXPECT_EQ(cs.num_fixed_columns(), 1u);
  EXPECT_EQ(cs.num_instance_columns(), 1u);
  EXPECT_EQ(cs.gates().size(), 5 + kRotateXorFns);
  EXPECT_EQ(cs.lookups().size(), 1u);
  EXPECT_FALSE(cs.equality_enabled(cfg.lookup.tag));
  EXPECT_TRUE(cs.equality_enabled(cfg.lookup.dense));
  EXPECT_TRUE(cs.equality_enabled(cfg.constant));
  EXPECT_EQ(cs.degree(), 9u);  // add carry range
}

TEST_F(Table16GatesTest, PiecePlacement) {
  for (size_t i = 0; i < kRotateXorFns; ++i) {
    const RotateXorShape& shape = rotate_xor_shape(static_cast<RotateXor>(i));
    std::vector<PiecePlacement> p = place_pieces(shape);
    EXPECT_EQ(p.size(), shape.pieces.size());
    EXPECT_EQ(p.back().start + p.back().bits, 32u);
  }
  EXPECT_EQ(lookup_rows(rotate_xor_shape(RotateXor::kLowerSigma0)), 2u);
  EXPECT_EQ(lookup_rows(rotate_xor_shape(RotateXor::kUpperSigma0)), 3u);
}

TEST_F(Table16GatesTest, Add) {
  std::vector<RoundWord> out;
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    std::vector<DensePair> terms;
    for (uint32_t x : kInputs) {
      if (terms.size() == kMaxAddTerms) break;
      terms.push_back(word(cfg, l, x).halves());
    }
    out.push_back(l.assign_region("add", [&](auto& region) {
      return Table16Gates::add(region, cfg, terms, 0x428a2f98);
    }));
    // largest carry: seven times 2^32 - 1 plus a constant
    std::vector<DensePair> ones(kMaxAddTerms,
                                word(cfg, l, 0xffffffffu).halves());
    out.push_back(l.assign_region("add", [&](auto& region) {
      return Table16Gates::add(region, cfg, ones, 0xffffffffu);
    }));
    out.push_back(l.assign_region("add", [&](auto& region) {
      return Table16Gates::add(region, cfg, {terms[0]}, 5);
    }));
  }};
  auto p = Prover::run(F, kLogRows, c);
  EXPECT_TRUE(p->verify().empty());

  uint32_t expect = 0x428a2f98;
  for (size_t i = 0; i < kMaxAddTerms; ++i) expect += kInputs[i];
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(fixtures::small_value(F, p->cell(out[0].dense.cell)), expect);
  EXPECT_EQ(value_of(*p, out[0].halves()), expect);
  EXPECT_EQ(fixtures::small_value(F, p->cell(out[1].dense.cell)),
            uint32_t(8 * 0xffffffffull));
  EXPECT_EQ(out[2].value().get(), 5u);
}

TEST_F(Table16GatesTest, RotateXor) {
  struct Out {
    uint32_t x;
    DensePair s[kRotateXorFns];
  };
  std::vector<Out> out;
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    for (uint32_t x : kInputs) {
      RoundWord w = word(cfg, l, x);
      Out o{x, {}};
      for (size_t i = 0; i < kRotateXorFns; ++i) {
        o.s[i] = l.assign_region("sigma", [&](auto& region) {
          return Table16Gates::rotate_xor(region, cfg,
                                          static_cast<RotateXor>(i), w);
        });
      }
      out.push_back(o);
    }
  }};
  auto p = Prover::run(F, kLogRows, c);
  EXPECT_TRUE(p->verify().empty());

  using fixtures::rotr;
  for (const Out& o : out) {
    uint32_t x = o.x;
    EXPECT_EQ(value_of(*p, o.s[0]), rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3));
    EXPECT_EQ(value_of(*p, o.s[1]), rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10));
    EXPECT_EQ(value_of(*p, o.s[2]), rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22));
    EXPECT_EQ(value_of(*p, o.s[3]), rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25));
  }
}

TEST_F(Table16GatesTest, ChAndMaj) {
  const uint32_t x = 0x510e527f, y = 0x9b05688c, z = 0x1f83d9ab;
  DensePair p_out, q_out, m_out;
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord wx = word(cfg, l, x), wy = word(cfg, l, y), wz = word(cfg, l, z);
    p_out = l.assign_region("ch", [&](auto& region) {
      return Table16Gates::spread_sum(region, cfg, SpreadSum::kCh, wx, wy,
                                      nullptr);
    });
    q_out = l.assign_region("ch_neg", [&](auto& region) {
      return Table16Gates::spread_sum(region, cfg, SpreadSum::kChNeg, wx, wz,
                                      nullptr);
    });
    m_out = l.assign_region("maj", [&](auto& region) {
      return Table16Gates::spread_sum(region, cfg, SpreadSum::kMaj, wx, wy,
                                      &wz);
    });
  }};
  auto p = Prover::run(F, kLogRows, c);
  EXPECT_TRUE(p->verify().empty());
  EXPECT_EQ(value_of(*p, p_out), x & y);
  EXPECT_EQ(value_of(*p, q_out), ~x & z);
  EXPECT_EQ(value_of(*p, p_out) + value_of(*p, q_out), (x & y) ^ (~x & z));
  EXPECT_EQ(value_of(*p, m_out), (x & y) ^ (x & z) ^ (y & z));
}

TEST_F(Table16GatesTest, MismatchedHalvesFail) {
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    l.assign_region("bad word", [&](auto& region) {
      region.enable_selector("word", cfg.s_word, 0);
      region.assign_advice("word", cfg.a[0], 0, Value<uint32_t>::known(5));
      SpreadTableChip::assign(region, cfg.lookup, 0,
                              Value<uint16_t>::known(3));
      SpreadTableChip::assign(region, cfg.lookup, 1,
                              Value<uint16_t>::known(0));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].kind, VerifyFailure::kConstraintNotSatisfied);
  EXPECT_EQ(failures[0].name, "word/recompose");
}

TEST_F(Table16GatesTest, CarryOutOfRangeFails) {
  // A carry of 8 balances the sum 1 + 0 only with the result 1 - 8 * 2^32,
  // which is not a 32-bit word.
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord w = word(cfg, l, 1);
    l.assign_region("bad add", [&](auto& region) {
      region.enable_selector("add", cfg.s_add, 0);
      region.enable_selector("word", cfg.s_word, 0);
      region.assign_fixed("K", cfg.constant, 0, Value<uint32_t>::known(0));
      region.copy_advice("term", w.lo.dense, cfg.a[2], 0);
      region.copy_advice("term", w.hi.dense, cfg.a[3], 0);
      for (size_t s = 2; s < 2 * kMaxAddTerms; ++s) {
        Column col = s < 6 ? cfg.a[2 + s] : cfg.a[s - 6];
        region.assign_advice("zero", col, s < 6 ? 0 : 1,
                             Value<uint16_t>::known(0));
      }
      region.assign_advice("carry", cfg.a[1], 0, Value<uint8_t>::known(8));
      Field::Elt res = F.subf(F.one(), F.mulf(F.of_scalar(8),
                                              F.of_scalar(uint64_t(1) << 32)));
      region.assign_advice("sum", cfg.a[0], 0, Value<Field::Elt>::known(res));
      SpreadTableChip::assign(region, cfg.lookup, 0,
                              Value<uint16_t>::known(1));
      SpreadTableChip::assign(region, cfg.lookup, 1,
                              Value<uint16_t>::known(0));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  // the sum holds, the carry range and the recomposition do not
  ASSERT_EQ(failures.size(), 2u);
  EXPECT_EQ(failures[0].name, "word/recompose");
  EXPECT_EQ(failures[1].name, "add/carry");
}

TEST_F(Table16GatesTest, RotationByZero) {
  for (uint32_t x : kInputs) {
    EXPECT_EQ(fixtures::rotr(x, 0), x);
    EXPECT_EQ(apply_term(RotateTerm{0, false}, x), x);
    EXPECT_EQ(fixtures::rotr(x, 8), apply_term(RotateTerm{8, false}, x));
  }
}

TEST_F(Table16GatesTest, UnusedAddSlotsArePinned) {
  // 1 + 0 claimed as 8 by placing 7 in an unused term slot.  The sum, the
  // carry range and the recomposition all hold; only the copy from the
  // pinned zero cell catches it.
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord w = word(cfg, l, 1);
    l.assign_region("add", [&](auto& region) {
      Table16Gates::add(region, cfg, {w.halves()}, 0);
      region.assign_advice("zero", cfg.a[4], 0, Value<uint16_t>::known(7));
      region.assign_advice("sum", cfg.a[0], 0, Value<uint32_t>::known(8));
      SpreadTableChip::assign(region, cfg.lookup, 0,
                              Value<uint16_t>::known(8));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].kind, VerifyFailure::kPermutation);
  EXPECT_EQ(failures[0].region, "add");
}

TEST_F(Table16GatesTest, UnusedAddSlotsShareOneConstant) {
  for (size_t n = 1; n <= kMaxAddTerms; ++n) {
    GateCircuit c{[&](const Table16Config& cfg, L& l) {
      std::vector<DensePair> terms(n, word(cfg, l, 0x80000001u).halves());
      RoundWord r = l.assign_region("add", [&](auto& region) {
        return Table16Gates::add(region, cfg, terms, 3);
      });
      EXPECT_EQ(r.value().get(), uint32_t(n * 0x80000001ull + 3));
    }};
    EXPECT_TRUE(Prover::run(F, kLogRows, c)->verify().empty()) << n;
  }
}

TEST_F(Table16GatesTest, OversizedPieceFailsTagBound) {
  // sigma0 cuts the word as 3, 4, 11 and 14 bits.  Moving the low bit of
  // the 14-bit piece into bit 11 of the 11-bit piece keeps the
  // recomposition, but the piece now carries the 13-bit tag.
  const uint32_t x = 0xdeadbeefu;
  const uint16_t p11 = (x >> 7) & 0x7ff, p14 = (x >> 18) & 0x3fff;
  ASSERT_GE(p14, 1);
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord w = word(cfg, l, x);
    l.assign_region("sigma0", [&](auto& region) {
      Table16Gates::rotate_xor(region, cfg, RotateXor::kLowerSigma0, w);
      SpreadTableChip::assign(
          region, cfg.lookup, 0,
          Value<uint16_t>::known(static_cast<uint16_t>(p11 | 0x800)));
      SpreadTableChip::assign(
          region, cfg.lookup, 1,
          Value<uint16_t>::known(static_cast<uint16_t>(p14 - 1)));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  EXPECT_TRUE(has_failure(failures, "sigma0/tag"));
  EXPECT_FALSE(has_failure(failures, "sigma0/recompose"));
}

TEST_F(Table16GatesTest, NonBooleanBitFails) {
  // bits 1..0 of x are 10; writing them as 0 and 2 keeps the recomposition
  const uint32_t x = 0xdeadbeeeu;
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord w = word(cfg, l, x);
    l.assign_region("sigma0", [&](auto& region) {
      Table16Gates::rotate_xor(region, cfg, RotateXor::kLowerSigma0, w);
      region.assign_advice("bit", cfg.a[2], 0, Value<uint32_t>::known(2));
      region.assign_advice("bit", cfg.a[3], 0, Value<uint32_t>::known(0));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  EXPECT_TRUE(has_failure(failures, "sigma0/bool"));
  EXPECT_FALSE(has_failure(failures, "sigma0/recompose"));
}

TEST_F(Table16GatesTest, SwappedRotateXorSplitFails) {
  const uint32_t x = 0x6a09e667u;
  const RotateXorShape& shape = rotate_xor_shape(RotateXor::kLowerSigma0);
  uint64_t total = 0;
  for (const auto& t : shape.terms) total += spread32(apply_term(t, x));
  const uint32_t lo = static_cast<uint32_t>(total);
  ASSERT_NE(even_bits(lo), odd_bits(lo));
  const size_t b = lookup_rows(shape);
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord w = word(cfg, l, x);
    l.assign_region("sigma0", [&](auto& region) {
      Table16Gates::rotate_xor(region, cfg, RotateXor::kLowerSigma0, w);
      SpreadTableChip::assign(region, cfg.lookup, b,
                              Value<uint16_t>::known(odd_bits(lo)));
      SpreadTableChip::assign(region, cfg.lookup, b + 1,
                              Value<uint16_t>::known(even_bits(lo)));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].name, "sigma0/spread");
}

TEST_F(Table16GatesTest, SwappedEvenOddFails) {
  const uint32_t x = 0x510e527f, y = 0x9b05688c;
  const uint32_t s = spread16(lo16(x)) + spread16(lo16(y));
  ASSERT_NE(even_bits(s), odd_bits(s));
  GateCircuit c{[&](const Table16Config& cfg, L& l) {
    RoundWord wx = word(cfg, l, x), wy = word(cfg, l, y);
    l.assign_region("ch", [&](auto& region) {
      Table16Gates::spread_sum(region, cfg, SpreadSum::kCh, wx, wy, nullptr);
      SpreadTableChip::assign(region, cfg.lookup, 0,
                              Value<uint16_t>::known(odd_bits(s)));
      SpreadTableChip::assign(region, cfg.lookup, 1,
                              Value<uint16_t>::known(even_bits(s)));
    });
  }};
  auto failures = Prover::run(F, kLogRows, c)->verify();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].kind, VerifyFailure::kConstraintNotSatisfied);
  EXPECT_EQ(failures[0].name, "ch/split");
}

TEST_F(Table16GatesTest, ForgedOddHalfFails) {
  const uint32_t x = 0x510e527f, y = 0x9b05688c, z = 0x1f83d9ab;
  const struct {
    SpreadSum kind;
    const char* name;
  } cases[] = {{SpreadSum::kCh, "ch/split"},
               {SpreadSum::kChNeg, "ch_neg/split"},
               {SpreadSum::kMaj, "maj/split"}};
  for (const auto& k : cases) {
    GateCircuit c{[&](const Table16Config& cfg, L& l) {
      RoundWord wx = word(cfg, l, x), wy = word(cfg, l, y),
                wz = word(cfg, l, z);
      l.assign_region("spread sum", [&](auto& region) {
        DensePair o = Table16Gates::spread_sum(
            region, cfg, k.kind, wx, wy,
            k.kind == SpreadSum::kMaj ? &wz : nullptr);
        SpreadTableChip::assign(region, cfg.lookup, 1,
                                o.lo.value.map([](uint16_t v) {
                                  return static_cast<uint16_t>(v ^ 1);
                                }));
      });
    }};
    auto failures = Prover::run(F, kLogRows, c)->verify();
    ASSERT_EQ(failures.size(), 1u) << k.name;
    EXPECT_EQ(failures[0].name, k.name);
  }
}

}  // namespace
}  // namespace sha256zk
