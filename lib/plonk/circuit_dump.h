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

#ifndef SHA256ZK_LIB_PLONK_CIRCUIT_DUMP_H_
#define SHA256ZK_LIB_PLONK_CIRCUIT_DUMP_H_

#include <stddef.h>

#include "plonk/constraint_system.h"
#include "util/log.h"

namespace sha256zk {

template <class Field>
void dump_info(const char* name, const ConstraintSystem<Field>& cs,
               size_t rows) {
  log(INFO,
      "%s: advice:%zu fixed:%zu instance:%zu selectors:%zu gates:%zu "
      "constraints:%zu lookups:%zu degree:%zu rows:%zu\n",
      name, cs.num_advice_columns(), cs.num_fixed_columns(),
      cs.num_instance_columns(), cs.num_selectors(), cs.gates().size(),
      cs.num_constraints(), cs.lookups().size(), cs.degree(), rows);
}

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_CIRCUIT_DUMP_H_
