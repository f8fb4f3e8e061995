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

#ifndef SHA256ZK_LIB_PLONK_CIRCUIT_SHAPE_H_
#define SHA256ZK_LIB_PLONK_CIRCUIT_SHAPE_H_

#include <stddef.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "plonk/circuit.h"
#include "plonk/constraint_system.h"
#include "plonk/layouter.h"
#include "plonk/value.h"
#include "util/panic.h"

namespace sha256zk {

// Layouter backend that records where regions land without looking at
// any value.  Synthesizing a circuit without a witness against this
// backend yields the layout that a witness pass must reproduce.
template <class FieldT>
class CircuitShape {
 public:
  using Field = FieldT;
  using Elt = typename Field::Elt;

  struct RegionInfo {
    std::string name;
    size_t start, end;
  };

  template <class Circuit>
  static std::unique_ptr<CircuitShape> run(const Field& F, size_t k,
                                           const Circuit& circuit) {
    ConstraintSystem<Field> cs(F);
    auto config = Circuit::configure(cs);
    auto shape = std::make_unique<CircuitShape>(F, k, std::move(cs));
    Layouter<CircuitShape> layouter(shape.get());
    circuit.synthesize(config, layouter);
    return shape;
  }

  CircuitShape(const Field& F, size_t k, ConstraintSystem<Field> cs)
      : f_(F), cs_(std::move(cs)), n_(size_t(1) << k) {}

  CircuitShape(const CircuitShape&) = delete;
  CircuitShape& operator=(const CircuitShape&) = delete;

  const Field& field() const { return f_; }
  const ConstraintSystem<Field>& cs() const { return cs_; }
  size_t usable_rows() const { return n_; }

  void enter_region(const char* name, size_t start) {
    regions_.push_back(RegionInfo{name, start, start});
  }
  void exit_region(size_t end) {
    check(!regions_.empty(), "exit_region(): no open region");
    regions_.back().end = end;
  }

  void enable_selector(const Selector& s, size_t row) {
    ++selector_rows_;
    touch(row);
  }
  void assign(const Column& c, size_t row, const Value<Elt>& v) {
    check(c.kind != ColumnKind::kInstance,
          "CircuitShape: cannot assign to an instance column");
    ++cells_;
    touch(row);
  }
  void copy(const Cell& a, const Cell& b) { ++copies_; }
  void fill_table(const TableColumn& t, size_t row, const Value<Elt>& v) {
    table_rows_ = std::max(table_rows_, row + 1);
  }

  size_t rows_used() const { return rows_used_; }
  size_t cells() const { return cells_; }
  size_t copies() const { return copies_; }
  size_t selector_rows() const { return selector_rows_; }
  size_t table_rows() const { return table_rows_; }
  const std::vector<RegionInfo>& regions() const { return regions_; }

 private:
  void touch(size_t row) { rows_used_ = std::max(rows_used_, row + 1); }

  const Field& f_;
  ConstraintSystem<Field> cs_;
  size_t n_;
  std::vector<RegionInfo> regions_;
  size_t rows_used_ = 0;
  size_t cells_ = 0;
  size_t copies_ = 0;
  size_t selector_rows_ = 0;
  size_t table_rows_ = 0;
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_CIRCUIT_SHAPE_H_
