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

#ifndef SHA256ZK_LIB_PLONK_MOCK_PROVER_H_
#define SHA256ZK_LIB_PLONK_MOCK_PROVER_H_

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "plonk/circuit.h"
#include "plonk/constraint_system.h"
#include "plonk/layouter.h"
#include "plonk/value.h"
#include "util/log.h"
#include "util/panic.h"

namespace sha256zk {

struct VerifyFailure {
  enum Kind {
    kConstraintNotSatisfied,
    kCellNotAssigned,
    kLookup,
    kPermutation,
    kInstance,  // copy to a public input that does not match
  };

  Kind kind;
  std::string region;  // region owning ROW, if any
  std::string name;    // gate, constraint or lookup name
  size_t row;
};

inline const char* verify_failure_kind_name(VerifyFailure::Kind k) {
  switch (k) {
    case VerifyFailure::kConstraintNotSatisfied:
      return "constraint not satisfied";
    case VerifyFailure::kCellNotAssigned:
      return "cell not assigned";
    case VerifyFailure::kLookup:
      return "lookup input not in table";
    case VerifyFailure::kPermutation:
      return "copy constraint violated";
    case VerifyFailure::kInstance:
      return "public input mismatch";
  }
  return "?";
}

// Evaluates every gate, lookup and copy constraint of a fully assigned
// circuit on a grid of 2^k rows and reports each violation.  Not a
// proof system: no commitments are made and nothing is hidden.
template <class FieldT>
class MockProver {
 public:
  using Field = FieldT;
  using Elt = typename Field::Elt;

  // Configures CIRCUIT, synthesizes it with a full witness and returns
  // the populated prover.  INSTANCE[i] holds the public values of the
  // i-th instance column; missing rows read as zero.
  template <class Circuit>
  static std::unique_ptr<MockProver> run(
      const Field& F, size_t k, const Circuit& circuit,
      std::vector<std::vector<Elt>> instance = {}) {
    ConstraintSystem<Field> cs(F);
    auto config = Circuit::configure(cs);
    check(instance.size() <= cs.num_instance_columns(),
          "MockProver::run(): too many instance columns");
    auto prover = std::make_unique<MockProver>(F, k, std::move(cs),
                                               std::move(instance));
    Layouter<MockProver> layouter(prover.get());
    circuit.synthesize(config, layouter);
    return prover;
  }

  MockProver(const Field& F, size_t k, ConstraintSystem<Field> cs,
             std::vector<std::vector<Elt>> instance)
      : f_(F),
        cs_(std::move(cs)),
        n_(size_t(1) << k),
        instance_(std::move(instance)),
        advice_(cs_.num_advice_columns()),
        fixed_(cs_.num_fixed_columns()),
        owner_advice_(cs_.num_advice_columns()),
        owner_fixed_(cs_.num_fixed_columns()),
        selectors_(cs_.num_selectors()),
        tables_(cs_.num_table_columns()) {
    check(k < 32, "MockProver: k too large");
    instance_.resize(cs_.num_instance_columns());
  }

  MockProver(const MockProver&) = delete;
  MockProver& operator=(const MockProver&) = delete;

  const Field& field() const { return f_; }
  const ConstraintSystem<Field>& cs() const { return cs_; }
  size_t usable_rows() const { return n_; }

  void enter_region(const char* name, size_t start) {
    check(current_ < 0, "enter_region(): regions do not nest");
    current_ = static_cast<int>(regions_.size());
    regions_.push_back(RegionInfo{name, start, start});
  }

  void exit_region(size_t end) {
    regions_[current_].end = end;
    current_ = -1;
  }

  void enable_selector(const Selector& s, size_t row) {
    grow(selectors_[s.index], row, false);
    selectors_[s.index][row] = true;
    touch(row);
  }

  void assign(const Column& c, size_t row, const Value<Elt>& v) {
    check(v.is_known(), "MockProver: witness value is unknown");
    std::vector<std::optional<Elt>>* col = nullptr;
    std::vector<int>* owner = nullptr;
    if (c.kind == ColumnKind::kAdvice) {
      col = &advice_[c.index];
      owner = &owner_advice_[c.index];
    } else if (c.kind == ColumnKind::kFixed) {
      col = &fixed_[c.index];
      owner = &owner_fixed_[c.index];
    } else {
      fail("MockProver: cannot assign to an instance column");
    }
    grow(*col, row, std::optional<Elt>());
    grow(*owner, row, -1);
    check((*owner)[row] < 0 || (*owner)[row] == current_,
          "MockProver: cell already assigned by another region");
    (*col)[row] = v.get();
    (*owner)[row] = current_;
    touch(row);
  }

  void copy(const Cell& a, const Cell& b) { copies_.emplace_back(a, b); }

  void fill_table(const TableColumn& t, size_t row, const Value<Elt>& v) {
    check(v.is_known(), "MockProver: table value is unknown");
    grow(tables_[t.index], row, std::optional<Elt>());
    tables_[t.index][row] = v.get();
  }

  // Number of rows below the last one holding an assignment or an enabled
  // selector.
  size_t rows_used() const { return rows_used_; }

  // Value of an assigned cell, for tests.
  std::optional<Elt> cell(const Cell& c) const {
    switch (c.column.kind) {
      case ColumnKind::kAdvice:
        return at(advice_[c.column.index], c.row);
      case ColumnKind::kFixed:
        return at(fixed_[c.column.index], c.row);
      case ColumnKind::kInstance:
        return instance_value(c.column.index, c.row);
    }
    return std::nullopt;
  }

  std::vector<VerifyFailure> verify() const {
    std::vector<VerifyFailure> failures;
    verify_gates(failures);
    verify_lookups(failures);
    verify_copies(failures);
    for (const auto& e : failures) {
      log(ERROR, "%s: %s at row %zu (region \"%s\")\n",
          verify_failure_kind_name(e.kind), e.name.c_str(), e.row,
          e.region.c_str());
    }
    return failures;
  }

 private:
  struct RegionInfo {
    std::string name;
    size_t start, end;
  };

  // Leaf accessor for Expression::evaluate() at a given row.  When STRICT,
  // a query of an unassigned advice cell is recorded in MISSING; otherwise
  // unassigned cells read as zero.
  struct RowQuery {
    const MockProver* p;
    size_t row;
    bool strict;
    std::optional<Cell> missing;

    Elt selector(size_t index) const {
      return p->selector_enabled(index, row) ? p->f_.one() : p->f_.zero();
    }
    Elt fixed(size_t index, Rotation rot) {
      auto r = rotate(rot);
      if (!r) return p->f_.zero();
      auto v = at(p->fixed_[index], *r);
      return v ? *v : p->f_.zero();
    }
    Elt advice(size_t index, Rotation rot) {
      auto r = rotate(rot);
      std::optional<Elt> v;
      if (r) v = at(p->advice_[index], *r);
      if (!v) {
        if (strict && !missing) {
          missing = Cell{Column{ColumnKind::kAdvice, index}, r ? *r : row};
        }
        return p->f_.zero();
      }
      return *v;
    }
    Elt instance(size_t index, Rotation rot) {
      auto r = rotate(rot);
      if (!r) return p->f_.zero();
      return p->instance_value(index, *r);
    }
    std::optional<size_t> rotate(Rotation rot) const {
      int64_t r = static_cast<int64_t>(row) + rot;
      if (r < 0 || r >= static_cast<int64_t>(p->n_)) return std::nullopt;
      return static_cast<size_t>(r);
    }
  };

  void verify_gates(std::vector<VerifyFailure>& failures) const {
    for (const auto& g : cs_.gates()) {
      const auto& sel = selectors_[g.selector.index];
      for (size_t row = 0; row < sel.size(); ++row) {
        if (!sel[row]) continue;
        for (const auto& c : g.constraints) {
          RowQuery q{this, row, true, std::nullopt};
          Elt v = c.poly.evaluate(f_, q);
          if (q.missing) {
            failures.push_back(VerifyFailure{VerifyFailure::kCellNotAssigned,
                                             region_at(q.missing->row),
                                             g.name + "/" + c.name,
                                             q.missing->row});
          } else if (v != f_.zero()) {
            failures.push_back(
                VerifyFailure{VerifyFailure::kConstraintNotSatisfied,
                              region_at(row), g.name + "/" + c.name, row});
          }
        }
      }
    }
  }

  void verify_lookups(std::vector<VerifyFailure>& failures) const {
    for (const auto& l : cs_.lookups()) {
      std::set<std::vector<uint64_t>> table;
      size_t len = 0;
      for (const auto& t : l.table) len = std::max(len, tables_[t.index].size());
      for (size_t row = 0; row < len; ++row) {
        std::vector<uint64_t> key;
        for (const auto& t : l.table) {
          auto v = at(tables_[t.index], row);
          check(v.has_value(), "verify(): lookup table has a hole");
          append(key, *v);
        }
        table.insert(std::move(key));
      }

      // Unassigned cells read as zero, so the all-zero tuple must be in
      // the table for rows the circuit does not use.
      for (size_t row = 0; row < n_; ++row) {
        RowQuery q{this, row, false, std::nullopt};
        std::vector<uint64_t> key;
        for (const auto& e : l.inputs) append(key, e.evaluate(f_, q));
        if (table.count(key) == 0) {
          failures.push_back(VerifyFailure{VerifyFailure::kLookup,
                                           region_at(row), l.name, row});
        }
      }
    }
  }

  void verify_copies(std::vector<VerifyFailure>& failures) const {
    for (const auto& c : copies_) {
      auto a = cell(c.first);
      auto b = cell(c.second);
      if (!a || !b || *a != *b) {
        const Cell& bad = (!a) ? c.first : c.second;
        char buf[96];
        snprintf(buf, sizeof(buf), "%s[%zu] -> %s[%zu]",
                 column_kind_name(c.first.column.kind), c.first.column.index,
                 column_kind_name(c.second.column.kind),
                 c.second.column.index);
        bool pub = c.first.column.kind == ColumnKind::kInstance ||
                   c.second.column.kind == ColumnKind::kInstance;
        failures.push_back(VerifyFailure{
            pub ? VerifyFailure::kInstance : VerifyFailure::kPermutation,
            region_at(bad.row), buf, bad.row});
      }
    }
  }

  static void append(std::vector<uint64_t>& key, const Elt& e) {
    key.insert(key.end(), e.n.limb_.begin(), e.n.limb_.end());
  }

  template <class T>
  static void grow(std::vector<T>& v, size_t row, const T& fill) {
    if (v.size() <= row) v.resize(row + 1, fill);
  }

  template <class T>
  static std::optional<T> at(const std::vector<std::optional<T>>& v,
                             size_t row) {
    if (row >= v.size()) return std::nullopt;
    return v[row];
  }

  Elt instance_value(size_t index, size_t row) const {
    const auto& col = instance_[index];
    return row < col.size() ? col[row] : f_.zero();
  }

  bool selector_enabled(size_t index, size_t row) const {
    const auto& s = selectors_[index];
    return row < s.size() && s[row];
  }

  void touch(size_t row) { rows_used_ = std::max(rows_used_, row + 1); }

  std::string region_at(size_t row) const {
    for (const auto& r : regions_) {
      if (r.start <= row && row < r.end) return r.name;
    }
    return "";
  }

  const Field& f_;
  ConstraintSystem<Field> cs_;
  size_t n_;
  std::vector<std::vector<Elt>> instance_;
  std::vector<std::vector<std::optional<Elt>>> advice_;
  std::vector<std::vector<std::optional<Elt>>> fixed_;
  std::vector<std::vector<int>> owner_advice_;
  std::vector<std::vector<int>> owner_fixed_;
  std::vector<std::vector<bool>> selectors_;
  std::vector<std::vector<std::optional<Elt>>> tables_;
  std::vector<std::pair<Cell, Cell>> copies_;
  std::vector<RegionInfo> regions_;
  int current_ = -1;
  size_t rows_used_ = 0;
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_MOCK_PROVER_H_
