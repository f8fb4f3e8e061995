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

#ifndef SHA256ZK_LIB_PLONK_LAYOUTER_H_
#define SHA256ZK_LIB_PLONK_LAYOUTER_H_

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <type_traits>
#include <utility>

#include "plonk/circuit.h"
#include "plonk/constraint_system.h"
#include "plonk/value.h"
#include "util/panic.h"

namespace sha256zk {

// The layouter is generic in a BACKEND that receives the assignments.
// A backend provides:
//
//   typedef Field;
//   const Field& field() const;
//   const ConstraintSystem<Field>& cs() const;
//   size_t usable_rows() const;
//   void enter_region(const char* name, size_t start);
//   void exit_region(size_t end);
//   void enable_selector(const Selector&, size_t row);
//   void assign(const Column&, size_t row, const Value<Elt>&);
//   void copy(const Cell&, const Cell&);
//   void fill_table(const TableColumn&, size_t row, const Value<Elt>&);
//
// MockProver checks a full witness, CircuitShape only records the layout.
// Shape errors common to both (wrong column kind, missing equality,
// row overflow) are caught here.

// Converts a semantic value to a field element.  Integral witnesses map
// to their embedding, field elements pass through.
template <class Field, class T>
typename Field::Elt to_field(const Field& F, const T& v) {
  if constexpr (std::is_integral_v<T>) {
    return F.of_scalar(static_cast<uint64_t>(v));
  } else {
    return v;
  }
}

template <class Backend>
class Region {
 public:
  using Field = typename Backend::Field;
  using Elt = typename Field::Elt;

  Region(Backend* b, size_t start) : b_(b), start_(start), height_(0) {}

  size_t start() const { return start_; }
  size_t height() const { return height_; }

  void enable_selector(const char* annotation, const Selector& s,
                       size_t offset) {
    check(s.index < b_->cs().num_selectors(),
          "enable_selector(): unknown selector");
    b_->enable_selector(s, row(offset));
  }

  template <class T>
  AssignedCell<T> assign_advice(const char* annotation, const Column& c,
                                size_t offset, const Value<T>& v) {
    check(c.kind == ColumnKind::kAdvice,
          "assign_advice(): not an advice column");
    return assign(c, offset, v);
  }

  template <class T>
  AssignedCell<T> assign_fixed(const char* annotation, const Column& c,
                               size_t offset, const Value<T>& v) {
    check(c.kind == ColumnKind::kFixed, "assign_fixed(): not a fixed column");
    return assign(c, offset, v);
  }

  // Assigns a constant to an advice cell and binds it, by a copy
  // constraint, to the same constant in the designated constant column.
  template <class T>
  AssignedCell<T> assign_advice_from_constant(const char* annotation,
                                              const Column& c, size_t offset,
                                              const T& k) {
    const auto& cs = b_->cs();
    check(cs.constants().has_value(),
          "assign_advice_from_constant(): no constant column");
    AssignedCell<T> cell =
        assign_advice(annotation, c, offset, Value<T>::known(k));
    AssignedCell<T> fixed =
        assign(*cs.constants(), offset, Value<T>::known(k));
    constrain_equal(cell.cell, fixed.cell);
    return cell;
  }

  // Assigns the value of SRC to a fresh advice cell and constrains the two
  // cells to be equal.
  template <class T>
  AssignedCell<T> copy_advice(const char* annotation,
                              const AssignedCell<T>& src, const Column& c,
                              size_t offset) {
    AssignedCell<T> dst = assign_advice(annotation, c, offset, src.value);
    constrain_equal(src.cell, dst.cell);
    return dst;
  }

  void constrain_equal(const Cell& a, const Cell& b) {
    const auto& cs = b_->cs();
    check(cs.equality_enabled(a.column) && cs.equality_enabled(b.column),
          "constrain_equal(): column without equality");
    b_->copy(a, b);
  }

 private:
  size_t row(size_t offset) {
    check(start_ + offset < b_->usable_rows(), "region exceeds the grid");
    height_ = std::max(height_, offset + 1);
    return start_ + offset;
  }

  template <class T>
  AssignedCell<T> assign(const Column& c, size_t offset, const Value<T>& v) {
    check(c.index < b_->cs().num_columns(c.kind), "assign(): unknown column");
    const Field& F = b_->field();
    Cell cell{c, row(offset)};
    b_->assign(c, cell.row, v.map([&F](const T& x) { return to_field(F, x); }));
    return AssignedCell<T>{v, cell};
  }

  Backend* b_;
  size_t start_;
  size_t height_;
};

template <class Backend>
class TableFiller {
 public:
  using Field = typename Backend::Field;

  explicit TableFiller(Backend* b) : b_(b) {}

  template <class T>
  void assign_cell(const char* annotation, const TableColumn& t, size_t offset,
                   const Value<T>& v) {
    check(t.index < b_->cs().num_table_columns(),
          "assign_cell(): unknown table column");
    check(offset < b_->usable_rows(), "table exceeds the grid");
    const Field& F = b_->field();
    b_->fill_table(t, offset,
                   v.map([&F](const T& x) { return to_field(F, x); }));
  }

 private:
  Backend* b_;
};

// Single-pass floor planner: regions are stacked one after the other in
// the order they are assigned.
template <class Backend>
class Layouter {
 public:
  using Field = typename Backend::Field;

  explicit Layouter(Backend* b) : b_(b), next_row_(0) {}

  const Field& field() const { return b_->field(); }

  // Calls FN(Region&) on a fresh region and returns what FN returns.
  template <class Fn>
  auto assign_region(const char* name, Fn fn) {
    Region<Backend> region(b_, next_row_);
    b_->enter_region(name, next_row_);
    if constexpr (std::is_void_v<decltype(fn(region))>) {
      fn(region);
      close(region);
    } else {
      auto r = fn(region);
      close(region);
      return r;
    }
  }

  template <class Fn>
  void assign_table(const char* name, Fn fn) {
    TableFiller<Backend> table(b_);
    fn(table);
  }

  // Constrains CELL to equal row ROW of the instance column INSTANCE.
  void constrain_instance(const Cell& cell, const Column& instance,
                          size_t row) {
    const auto& cs = b_->cs();
    check(instance.kind == ColumnKind::kInstance,
          "constrain_instance(): not an instance column");
    check(cs.equality_enabled(cell.column) && cs.equality_enabled(instance),
          "constrain_instance(): column without equality");
    b_->copy(cell, Cell{instance, row});
  }

  size_t rows_used() const { return next_row_; }

 private:
  void close(const Region<Backend>& region) {
    next_row_ += region.height();
    b_->exit_region(next_row_);
  }

  Backend* b_;
  size_t next_row_;
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_LAYOUTER_H_
