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

#ifndef SHA256ZK_LIB_CIRCUITS_SHA256_TABLE16_GATES_H_
#define SHA256ZK_LIB_CIRCUITS_SHA256_TABLE16_GATES_H_

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "circuits/sha256/bits.h"
#include "circuits/sha256/spread_table.h"
#include "plonk/circuit.h"
#include "plonk/constraint_system.h"
#include "plonk/value.h"
#include "util/panic.h"

namespace sha256zk {

/*
Column layout.  Advice columns a0..a2 are the spread table inputs
(tag, dense, spread) and are looked up on every row; a3..a10 are general
advice.  One fixed column holds round constants and the constants copied
into the IV.  Every column except the tag takes part in copy constraints.

All SHA-256 words enter and leave regions as two 16-bit halves, each
bound by a spread table lookup.  The gates are:

  word:      a3 = a1 + 2^16 a1[+1]
             (a 32-bit word and the lookup rows of its halves)

  add:       sum_i (lo_i + 2^16 hi_i) + constant = a3 + 2^32 a4,
             a4 in [0, 7]
             (up to 7 terms; the halves of the terms sit in a5..a10 of
             the first row and a3..a10 of the second)

  ch, ch_neg, maj:
             X_lo + Y_lo + 2^32 (X_hi + Y_hi) = E0 + 2 O0 + 2^32 (E1 + 2 O1)
             with X = S(x), S(~x) or the sum S(x) + S(z) for maj,
             the spreads of the operands copied into a3..a8 and E0, O0,
             E1, O1 the spreads of four lookup rows.  The odd bits give
             AND (ch) or majority (maj).

  rotate-xor (one gate per sigma function):
             the word is cut into pieces at the rotation amounts; long
             pieces are lookup rows with a bound on the tag, short pieces
             are boolean cells.  The pieces recompose the word and the
             sum of the three rotated spreads equals E + 2 O as above;
             the even bits are the XOR.
*/

using HalfWord16 = AssignedCell<uint16_t>;
using Word32 = AssignedCell<uint32_t>;

constexpr size_t kGeneralAdvice = 8;
constexpr size_t kMaxAddTerms = 7;
constexpr uint32_t kSpreadOnes16 = 0x55555555u;  // spread16(0xffff)

inline uint32_t join16(uint16_t lo, uint16_t hi) {
  return uint32_t(lo) | (uint32_t(hi) << 16);
}
inline uint16_t lo16(uint32_t x) { return static_cast<uint16_t>(x); }
inline uint16_t hi16(uint32_t x) { return static_cast<uint16_t>(x >> 16); }

// Dense halves of a 32-bit value, the operand type of the add gate.
struct DensePair {
  HalfWord16 lo, hi;

  Value<uint32_t> value() const { return lift(join16, lo.value, hi.value); }
};

// A 32-bit word with both halves looked up in the spread table, together
// with the 32-bit cell they recompose to.
struct RoundWord {
  SpreadVar lo, hi;
  Word32 dense;

  DensePair halves() const { return DensePair{lo.dense, hi.dense}; }
  Value<uint32_t> value() const { return dense.value; }
};

enum class SpreadSum { kCh, kChNeg, kMaj };

enum class RotateXor { kLowerSigma0, kLowerSigma1, kUpperSigma0, kUpperSigma1 };
constexpr size_t kRotateXorFns = 4;

// A cut of the word, least significant first.
struct RotatePiece {
  size_t bits;
  bool lookup;  // lookup row, else one boolean cell per bit
};

struct RotateTerm {
  size_t amount;
  bool shift;  // shr, else rotr
};

struct RotateXorShape {
  const char* name;
  std::vector<RotatePiece> pieces;
  std::array<RotateTerm, 3> terms;
};

inline const RotateXorShape& rotate_xor_shape(RotateXor fn) {
  static const RotateXorShape shapes[kRotateXorFns] = {
      {"sigma0",
       {{3, false}, {4, false}, {11, true}, {14, true}},
       {{{7, false}, {18, false}, {3, true}}}},
      {"sigma1",
       {{10, true}, {7, true}, {2, false}, {13, true}},
       {{{17, false}, {19, false}, {10, true}}}},
      {"Sigma0",
       {{2, false}, {11, true}, {7, true}, {2, false}, {10, true}},
       {{{2, false}, {13, false}, {22, false}}}},
      {"Sigma1",
       {{6, false}, {5, false}, {14, true}, {7, true}},
       {{{6, false}, {11, false}, {25, false}}}},
  };
  return shapes[static_cast<size_t>(fn)];
}

// Bit position at which the bit at START lands in term T, or -1 if the
// shift drops it.
inline int term_position(const RotateTerm& t, size_t start) {
  if (t.shift) return start >= t.amount ? int(start - t.amount) : -1;
  return int((start + 32 - t.amount) % 32);
}

inline uint32_t apply_term(const RotateTerm& t, uint32_t x) {
  if (t.shift) return x >> t.amount;
  return (x >> t.amount) | (x << ((32 - t.amount) % 32));
}

// Placement of a piece within a rotate-xor region.  Lookup pieces occupy
// rows 0..L-1 in order; boolean cells are numbered 0.. in order and cell
// k sits at row k / 6 of column a[2 + k % 6].
struct PiecePlacement {
  size_t start, bits;
  bool lookup;
  size_t row;   // lookup row
  size_t slot;  // first boolean cell
};

constexpr size_t kBitSlotsPerRow = 6;
constexpr size_t kBitSlots = 2 * kBitSlotsPerRow;

inline std::vector<PiecePlacement> place_pieces(const RotateXorShape& shape) {
  std::vector<PiecePlacement> r;
  size_t start = 0, row = 0, slot = 0;
  for (const auto& p : shape.pieces) {
    r.push_back(PiecePlacement{start, p.bits, p.lookup, row, slot});
    if (p.lookup) {
      ++row;
    } else {
      slot += p.bits;
    }
    start += p.bits;
  }
  check(start == 32, "rotate-xor pieces do not cover the word");
  check(slot <= kBitSlots, "rotate-xor: too many boolean cells");
  check(row >= 2, "rotate-xor: boolean cells need two rows");
  for (const auto& p : r) {
    for (const auto& t : shape.terms) {
      int pos = term_position(t, p.start);
      if (t.shift) {
        check(p.start >= t.amount || p.start + p.bits <= t.amount,
              "rotate-xor: piece straddles the shift");
      } else {
        check(size_t(pos) + p.bits <= 32,
              "rotate-xor: piece straddles the rotation");
      }
    }
  }
  return r;
}

inline size_t lookup_rows(const RotateXorShape& shape) {
  size_t n = 0;
  for (const auto& p : shape.pieces) n += p.lookup;
  return n;
}

struct Table16Config {
  SpreadTableConfig lookup;
  std::array<Column, kGeneralAdvice> a;  // a3..a10
  Column constant;
  Column instance;
  Selector s_word, s_add, s_ch, s_ch_neg, s_maj;
  std::array<Selector, kRotateXorFns> s_rotate;
};

class Table16Gates {
 public:
  template <class Field>
  static Table16Config configure(ConstraintSystem<Field>& cs) {
    Column tag = cs.advice_column();
    Column dense = cs.advice_column();
    Column spread = cs.advice_column();
    std::array<Column, kGeneralAdvice> a;
    for (size_t i = 0; i < kGeneralAdvice; ++i) a[i] = cs.advice_column();
    Column constant = cs.fixed_column();
    Column instance = cs.instance_column();

    cs.enable_equality(dense);
    cs.enable_equality(spread);
    for (const auto& c : a) cs.enable_equality(c);
    cs.enable_constant(constant);
    cs.enable_equality(instance);

    Table16Config cfg{SpreadTableChip::configure(cs, tag, dense, spread),
                      a,
                      constant,
                      instance,
                      cs.selector(),
                      cs.selector(),
                      cs.selector(),
                      cs.selector(),
                      cs.selector(),
                      {}};
    for (auto& s : cfg.s_rotate) s = cs.selector();

    configure_word(cs, cfg);
    configure_add(cs, cfg);
    configure_spread_sum(cs, cfg, SpreadSum::kCh);
    configure_spread_sum(cs, cfg, SpreadSum::kChNeg);
    configure_spread_sum(cs, cfg, SpreadSum::kMaj);
    for (size_t i = 0; i < kRotateXorFns; ++i) {
      configure_rotate_xor(cs, cfg, static_cast<RotateXor>(i));
    }
    return cfg;
  }

  // Region of two lookup rows splitting the word in a3 of row 0.  The
  // word cell is produced by one of the three functions below.
  template <class Region>
  static RoundWord decompose(Region& region, const Table16Config& cfg,
                             const Value<uint32_t>& w) {
    return finish_word(region, cfg,
                       region.assign_advice("word", cfg.a[0], 0, w));
  }

  template <class Region>
  static RoundWord decompose_constant(Region& region, const Table16Config& cfg,
                                      uint32_t w) {
    return finish_word(region, cfg,
                       region.assign_advice_from_constant("word", cfg.a[0], 0,
                                                          w));
  }

  template <class Region>
  static RoundWord decompose_copy(Region& region, const Table16Config& cfg,
                                  const Word32& w) {
    return finish_word(region, cfg,
                       region.copy_advice("word", w, cfg.a[0], 0));
  }

  // Two-row region computing the sum of TERMS plus K modulo 2^32.
  template <class Region>
  static RoundWord add(Region& region, const Table16Config& cfg,
                       const std::vector<DensePair>& terms, uint32_t k) {
    check(!terms.empty() && terms.size() <= kMaxAddTerms,
          "add(): unsupported number of terms");
    region.enable_selector("add", cfg.s_add, 0);

    Value<uint64_t> total = Value<uint64_t>::known(k);
    for (size_t j = 0; j < terms.size(); ++j) {
      const DensePair& t = terms[j];
      copy_slot(region, cfg, 2 * j, t.lo);
      copy_slot(region, cfg, 2 * j + 1, t.hi);
      total = lift([](uint64_t s, uint32_t v) { return s + v; }, total,
                   t.value());
    }
    zero_slots(region, cfg, 2 * terms.size());

    region.assign_fixed("K", cfg.constant, 0, Value<uint32_t>::known(k));
    region.assign_advice(
        "carry", cfg.a[1], 0,
        total.map([](uint64_t s) { return static_cast<uint8_t>(s >> 32); }));
    Word32 res = region.assign_advice(
        "sum", cfg.a[0], 0,
        total.map([](uint64_t s) { return static_cast<uint32_t>(s); }));
    return finish_word(region, cfg, res);
  }

  // Four-row region whose lookup rows split a spread sum of the operand
  // halves.  Returns the odd halves: x AND y for kCh, (NOT x) AND y for
  // kChNeg and majority(x, y, z) for kMaj.
  template <class Region>
  static DensePair spread_sum(Region& region, const Table16Config& cfg,
                              SpreadSum kind, const RoundWord& x,
                              const RoundWord& y, const RoundWord* z) {
    check((kind == SpreadSum::kMaj) == (z != nullptr),
          "spread_sum(): maj takes three operands");
    region.enable_selector("spread sum", spread_sum_selector(cfg, kind), 0);
    region.copy_advice("x_lo", x.lo.spread, cfg.a[0], 0);
    region.copy_advice("x_hi", x.hi.spread, cfg.a[1], 0);
    region.copy_advice("y_lo", y.lo.spread, cfg.a[2], 0);
    region.copy_advice("y_hi", y.hi.spread, cfg.a[3], 0);

    auto f = [kind](uint32_t sx, uint32_t sy) {
      return (kind == SpreadSum::kChNeg ? kSpreadOnes16 - sx : sx) + sy;
    };
    Value<uint32_t> sum_lo = lift(f, x.lo.spread.value, y.lo.spread.value);
    Value<uint32_t> sum_hi = lift(f, x.hi.spread.value, y.hi.spread.value);
    if (z != nullptr) {
      region.copy_advice("z_lo", z->lo.spread, cfg.a[4], 0);
      region.copy_advice("z_hi", z->hi.spread, cfg.a[5], 0);
      auto plus = [](uint32_t s, uint32_t sz) { return s + sz; };
      sum_lo = lift(plus, sum_lo, z->lo.spread.value);
      sum_hi = lift(plus, sum_hi, z->hi.spread.value);
    }
    return split_spread_sum(region, cfg, 0, sum_lo, sum_hi).second;
  }

  // Region computing one of the four sigma functions of X.  Returns the
  // dense halves of the result.
  template <class Region>
  static DensePair rotate_xor(Region& region, const Table16Config& cfg,
                              RotateXor fn, const RoundWord& x) {
    const RotateXorShape& shape = rotate_xor_shape(fn);
    std::vector<PiecePlacement> pieces = place_pieces(shape);
    const size_t nl = lookup_rows(shape);

    region.enable_selector(shape.name, cfg.s_rotate[static_cast<size_t>(fn)],
                           0);
    region.copy_advice("x_lo", x.lo.dense, cfg.a[0], 0);
    region.copy_advice("x_hi", x.hi.dense, cfg.a[1], 0);

    Value<uint32_t> w = x.halves().value();
    for (const auto& p : pieces) {
      if (p.lookup) {
        SpreadTableChip::assign(
            region, cfg.lookup, p.row, w.map([&p](uint32_t v) {
              return static_cast<uint16_t>((v >> p.start) &
                                           ((uint32_t(1) << p.bits) - 1));
            }));
      } else {
        for (size_t j = 0; j < p.bits; ++j) {
          size_t k = p.slot + j, bit = p.start + j;
          region.assign_advice(
              "bit", cfg.a[2 + k % kBitSlotsPerRow], k / kBitSlotsPerRow,
              w.map([bit](uint32_t v) { return ((v >> bit) & 1) != 0; }));
        }
      }
    }

    // Count of set bits per position across the three terms, as a
    // spread-sum: the low bit of each pair is the XOR, the high bit the
    // majority.
    auto total = w.map([&shape](uint32_t v) {
      uint64_t s = 0;
      for (const auto& t : shape.terms) s += spread32(apply_term(t, v));
      return s;
    });
    auto sum_lo =
        total.map([](uint64_t s) { return static_cast<uint32_t>(s); });
    auto sum_hi =
        total.map([](uint64_t s) { return static_cast<uint32_t>(s >> 32); });
    return split_spread_sum(region, cfg, nl, sum_lo, sum_hi).first;
  }

 private:
  template <class Region>
  static RoundWord finish_word(Region& region, const Table16Config& cfg,
                               const Word32& w) {
    region.enable_selector("word", cfg.s_word, 0);
    SpreadVar lo = SpreadTableChip::assign(region, cfg.lookup, 0,
                                           w.value.map(lo16));
    SpreadVar hi = SpreadTableChip::assign(region, cfg.lookup, 1,
                                           w.value.map(hi16));
    return RoundWord{lo, hi, w};
  }

  // Lookup rows B..B+3 hold E0, O0, E1, O1, the even and odd bits of the
  // low and high 32 bits of a spread sum.  Returns (E, O).
  template <class Region>
  static std::pair<DensePair, DensePair> split_spread_sum(
      Region& region, const Table16Config& cfg, size_t b,
      const Value<uint32_t>& sum_lo, const Value<uint32_t>& sum_hi) {
    SpreadVar e0 = SpreadTableChip::assign(region, cfg.lookup, b,
                                           sum_lo.map(even_bits));
    SpreadVar o0 = SpreadTableChip::assign(region, cfg.lookup, b + 1,
                                           sum_lo.map(odd_bits));
    SpreadVar e1 = SpreadTableChip::assign(region, cfg.lookup, b + 2,
                                           sum_hi.map(even_bits));
    SpreadVar o1 = SpreadTableChip::assign(region, cfg.lookup, b + 3,
                                           sum_hi.map(odd_bits));
    return {DensePair{e0.dense, e1.dense}, DensePair{o0.dense, o1.dense}};
  }

  // Add-gate term slot S: six slots in a5..a10 of row 0, eight in
  // a3..a10 of row 1.
  static Column slot_column(const Table16Config& cfg, size_t s) {
    return s < 6 ? cfg.a[2 + s] : cfg.a[s - 6];
  }
  static size_t slot_row(size_t s) { return s < 6 ? 0 : 1; }

  template <class Region>
  static void copy_slot(Region& region, const Table16Config& cfg, size_t s,
                        const HalfWord16& h) {
    region.copy_advice("term", h, slot_column(cfg, s), slot_row(s));
  }

  // Slots FIRST..13 are unused and must be zero.  The last slot sits in
  // row 1, so it is pinned to a zero in the constant column (row 0 holds
  // K) and the others are copies of it.
  template <class Region>
  static void zero_slots(Region& region, const Table16Config& cfg,
                         size_t first) {
    constexpr size_t kLast = 2 * kMaxAddTerms - 1;
    if (first > kLast) return;
    HalfWord16 zero = region.assign_advice_from_constant(
        "zero", slot_column(cfg, kLast), slot_row(kLast), uint16_t(0));
    for (size_t s = first; s < kLast; ++s) {
      region.copy_advice("zero", zero, slot_column(cfg, s), slot_row(s));
    }
  }

  static Selector spread_sum_selector(const Table16Config& cfg,
                                      SpreadSum kind) {
    switch (kind) {
      case SpreadSum::kCh:
        return cfg.s_ch;
      case SpreadSum::kChNeg:
        return cfg.s_ch_neg;
      case SpreadSum::kMaj:
        return cfg.s_maj;
    }
    fail("spread_sum_selector(): bad kind");
  }

  // E0 + 2 O0 + 2^32 (E1 + 2 O1) over the spreads of lookup rows B..B+3.
  template <class Field>
  static Expression<Field> spread_split(const ConstraintSystem<Field>& cs,
                                        const Table16Config& cfg, int b) {
    auto s = [&](int r) { return cs.query_advice(cfg.lookup.spread, b + r); };
    return s(0) + cs.konst(2) * s(1) +
           cs.konst(uint64_t(1) << 32) * (s(2) + cs.konst(2) * s(3));
  }

  template <class Field>
  static void configure_word(ConstraintSystem<Field>& cs,
                             const Table16Config& cfg) {
    auto w = cs.query_advice(cfg.a[0], 0);
    auto lo = cs.query_advice(cfg.lookup.dense, 0);
    auto hi = cs.query_advice(cfg.lookup.dense, 1);
    cs.create_gate("word", cfg.s_word,
                   {{"recompose", lo + cs.konst(1 << 16) * hi - w}});
  }

  template <class Field>
  static void configure_add(ConstraintSystem<Field>& cs,
                            const Table16Config& cfg) {
    Expression<Field> sum = cs.query_fixed(cfg.constant, 0);
    for (size_t j = 0; j < kMaxAddTerms; ++j) {
      size_t s = 2 * j;
      auto lo = cs.query_advice(slot_column(cfg, s), int(slot_row(s)));
      auto hi = cs.query_advice(slot_column(cfg, s + 1), int(slot_row(s + 1)));
      sum = sum + lo + cs.konst(1 << 16) * hi;
    }
    auto res = cs.query_advice(cfg.a[0], 0);
    auto carry = cs.query_advice(cfg.a[1], 0);
    Expression<Field> range = carry;
    for (uint64_t c = 1; c < kMaxAddTerms + 1; ++c) {
      range = range * (carry - cs.konst(c));
    }
    cs.create_gate(
        "add", cfg.s_add,
        {{"sum", sum - res - cs.konst(uint64_t(1) << 32) * carry},
         {"carry", range}});
  }

  template <class Field>
  static void configure_spread_sum(ConstraintSystem<Field>& cs,
                                   const Table16Config& cfg, SpreadSum kind) {
    auto q = [&](size_t i) { return cs.query_advice(cfg.a[i], 0); };
    Expression<Field> x_lo = q(0), x_hi = q(1);
    const char* name = "ch";
    if (kind == SpreadSum::kChNeg) {
      x_lo = cs.konst(kSpreadOnes16) - x_lo;
      x_hi = cs.konst(kSpreadOnes16) - x_hi;
      name = "ch_neg";
    }
    Expression<Field> lo = x_lo + q(2);
    Expression<Field> hi = x_hi + q(3);
    if (kind == SpreadSum::kMaj) {
      lo = lo + q(4);
      hi = hi + q(5);
      name = "maj";
    }
    cs.create_gate(
        name, spread_sum_selector(cfg, kind),
        {{"split", lo + cs.konst(uint64_t(1) << 32) * hi -
                       spread_split(cs, cfg, 0)}});
  }

  template <class Field>
  static void configure_rotate_xor(ConstraintSystem<Field>& cs,
                                   const Table16Config& cfg, RotateXor fn) {
    using Constraint = typename ConstraintSystem<Field>::Constraint;
    const RotateXorShape& shape = rotate_xor_shape(fn);
    std::vector<PiecePlacement> pieces = place_pieces(shape);
    const int nl = int(lookup_rows(shape));

    auto bit = [&](size_t k) {
      return cs.query_advice(cfg.a[2 + k % kBitSlotsPerRow],
                             int(k / kBitSlotsPerRow));
    };

    std::vector<Constraint> constraints;
    Expression<Field> recompose = -(cs.query_advice(cfg.a[0], 0) +
                                    cs.konst(1 << 16) *
                                        cs.query_advice(cfg.a[1], 0));
    Expression<Field> rotated = -spread_split(cs, cfg, nl);

    for (const auto& p : pieces) {
      if (p.lookup) {
        auto dense = cs.query_advice(cfg.lookup.dense, int(p.row));
        auto spread = cs.query_advice(cfg.lookup.spread, int(p.row));
        auto tag = cs.query_advice(cfg.lookup.tag, int(p.row));
        recompose = recompose + cs.konst(uint64_t(1) << p.start) * dense;
        for (const auto& t : shape.terms) {
          int pos = term_position(t, p.start);
          if (pos < 0) continue;
          rotated = rotated + cs.konst(uint64_t(1) << (2 * pos)) * spread;
        }
        Expression<Field> bound = tag;
        for (uint64_t c = 1; c <= tag_class_for_bits(p.bits); ++c) {
          bound = bound * (tag - cs.konst(c));
        }
        constraints.push_back(Constraint{"tag", bound});
      } else {
        for (size_t j = 0; j < p.bits; ++j) {
          auto b = bit(p.slot + j);
          recompose = recompose + cs.konst(uint64_t(1) << (p.start + j)) * b;
          for (const auto& t : shape.terms) {
            int pos = term_position(t, p.start + j);
            if (pos < 0) continue;
            rotated = rotated + cs.konst(uint64_t(1) << (2 * pos)) * b;
          }
          constraints.push_back(
              Constraint{"bool", b * (cs.konst(1) - b)});
        }
      }
    }
    constraints.push_back(Constraint{"recompose", recompose});
    constraints.push_back(Constraint{"spread", rotated});
    cs.create_gate(shape.name, cfg.s_rotate[static_cast<size_t>(fn)],
                   std::move(constraints));
  }
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_CIRCUITS_SHA256_TABLE16_GATES_H_
