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

#ifndef SHA256ZK_LIB_PLONK_CIRCUIT_H_
#define SHA256ZK_LIB_PLONK_CIRCUIT_H_

#include <stddef.h>

#include "plonk/value.h"

namespace sha256zk {

// Handles shared by the configuration and the synthesis phases of a
// PLONKish circuit.  A circuit is a grid of rows and columns; advice
// columns hold the private witness, fixed columns hold constants chosen at
// configuration time and instance columns hold public inputs.
enum class ColumnKind { kAdvice, kFixed, kInstance };

struct Column {
  ColumnKind kind;
  size_t index;

  bool operator==(const Column& y) const {
    return kind == y.kind && index == y.index;
  }
  bool operator!=(const Column& y) const { return !(*this == y); }
  bool operator<(const Column& y) const {
    if (kind != y.kind) return kind < y.kind;
    return index < y.index;
  }
};

// Boolean fixed column that switches a gate on for a row.
struct Selector {
  size_t index;
};

// Column of a lookup table.
struct TableColumn {
  size_t index;
};

// Relative row offset used when a gate queries a column.
using Rotation = int;

struct Cell {
  Column column;
  size_t row;  // absolute
};

// Handle to an assigned cell, used later in copy constraints.  T is the
// semantic type of the value (a 16-bit half, a spread, a carry ...).
template <class T>
struct AssignedCell {
  Value<T> value;
  Cell cell;
};

inline const char* column_kind_name(ColumnKind k) {
  switch (k) {
    case ColumnKind::kAdvice:
      return "advice";
    case ColumnKind::kFixed:
      return "fixed";
    case ColumnKind::kInstance:
      return "instance";
  }
  return "?";
}

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_CIRCUIT_H_
