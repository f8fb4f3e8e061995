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

#ifndef SHA256ZK_LIB_PLONK_CONSTRAINT_SYSTEM_H_
#define SHA256ZK_LIB_PLONK_CONSTRAINT_SYSTEM_H_

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "plonk/circuit.h"
#include "plonk/expression.h"
#include "util/panic.h"

namespace sha256zk {

// Shape of a PLONKish circuit: columns, selectors, gates, lookups and the
// set of columns that take part in copy constraints.  Built once by a
// circuit's configure() and never modified during synthesis.
template <class Field>
class ConstraintSystem {
 public:
  using Elt = typename Field::Elt;
  using Expr = Expression<Field>;

  struct Constraint {
    std::string name;
    Expr poly;
  };

  // All constraints of a gate are multiplied by its selector, so a gate
  // only binds the rows where the selector is enabled.
  struct Gate {
    std::string name;
    Selector selector;
    std::vector<Constraint> constraints;
  };

  // Every row, the tuple of INPUTS must appear as a row of TABLE.
  struct Lookup {
    std::string name;
    std::vector<Expr> inputs;
    std::vector<TableColumn> table;
  };

  explicit ConstraintSystem(const Field& F) : f_(F) {}

  const Field& field() const { return f_; }

  Column advice_column() { return Column{ColumnKind::kAdvice, nadvice_++}; }
  Column fixed_column() { return Column{ColumnKind::kFixed, nfixed_++}; }
  Column instance_column() {
    return Column{ColumnKind::kInstance, ninstance_++};
  }
  Selector selector() { return Selector{nselectors_++}; }
  TableColumn lookup_table_column() { return TableColumn{ntables_++}; }

  void enable_equality(const Column& c) {
    check_column(c);
    equality_.insert(c);
  }

  bool equality_enabled(const Column& c) const {
    return equality_.count(c) != 0;
  }

  // Designates C as the column holding circuit constants that are
  // copied into advice cells.
  void enable_constant(const Column& c) {
    check(c.kind == ColumnKind::kFixed,
          "enable_constant(): constants live in a fixed column");
    check(!constants_.has_value() || *constants_ == c,
          "enable_constant(): a constant column is already designated");
    enable_equality(c);
    constants_ = c;
  }

  const std::optional<Column>& constants() const { return constants_; }

  Expr query_advice(const Column& c, Rotation rot) const {
    check(c.kind == ColumnKind::kAdvice, "query_advice(): not an advice column");
    check_column(c);
    return Expr::query(c, rot);
  }
  Expr query_fixed(const Column& c, Rotation rot) const {
    check(c.kind == ColumnKind::kFixed, "query_fixed(): not a fixed column");
    check_column(c);
    return Expr::query(c, rot);
  }
  Expr query_instance(const Column& c, Rotation rot) const {
    check(c.kind == ColumnKind::kInstance,
          "query_instance(): not an instance column");
    check_column(c);
    return Expr::query(c, rot);
  }

  Expr konst(uint64_t k) const { return Expr::constant(f_.of_scalar(k)); }
  Expr konst(const Elt& k) const { return Expr::constant(k); }

  void create_gate(const char* name, const Selector& s,
                   std::vector<Constraint> constraints) {
    check(s.index < nselectors_, "create_gate(): unknown selector");
    check(!constraints.empty(), "create_gate(): gate without constraints");
    gates_.push_back(Gate{name, s, std::move(constraints)});
  }

  void lookup(const char* name,
              const std::vector<std::pair<Expr, TableColumn>>& pairs) {
    check(!pairs.empty(), "lookup(): empty argument");
    Lookup l{name, {}, {}};
    for (const auto& p : pairs) {
      check(p.second.index < ntables_, "lookup(): unknown table column");
      l.inputs.push_back(p.first);
      l.table.push_back(p.second);
    }
    lookups_.push_back(std::move(l));
  }

  size_t num_advice_columns() const { return nadvice_; }
  size_t num_fixed_columns() const { return nfixed_; }
  size_t num_instance_columns() const { return ninstance_; }
  size_t num_selectors() const { return nselectors_; }
  size_t num_table_columns() const { return ntables_; }

  size_t num_columns(ColumnKind k) const {
    switch (k) {
      case ColumnKind::kAdvice:
        return nadvice_;
      case ColumnKind::kFixed:
        return nfixed_;
      case ColumnKind::kInstance:
        return ninstance_;
    }
    return 0;
  }

  const std::vector<Gate>& gates() const { return gates_; }
  const std::vector<Lookup>& lookups() const { return lookups_; }
  const std::set<Column>& equality_columns() const { return equality_; }

  size_t num_constraints() const {
    size_t n = 0;
    for (const auto& g : gates_) n += g.constraints.size();
    return n;
  }

  // Maximum degree of any constraint, counting the selector factor, and
  // of any lookup argument.
  size_t degree() const {
    size_t d = 1;
    for (const auto& g : gates_) {
      for (const auto& c : g.constraints) {
        d = std::max(d, 1 + c.poly.degree());
      }
    }
    for (const auto& l : lookups_) {
      for (const auto& e : l.inputs) {
        d = std::max(d, 2 + e.degree());
      }
    }
    return d;
  }

 private:
  void check_column(const Column& c) const {
    check(c.index < num_columns(c.kind), "unknown column");
  }

  const Field& f_;
  size_t nadvice_ = 0;
  size_t nfixed_ = 0;
  size_t ninstance_ = 0;
  size_t nselectors_ = 0;
  size_t ntables_ = 0;
  std::set<Column> equality_;
  std::optional<Column> constants_;
  std::vector<Gate> gates_;
  std::vector<Lookup> lookups_;
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_CONSTRAINT_SYSTEM_H_
