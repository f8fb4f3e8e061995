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

#ifndef SHA256ZK_LIB_ALGEBRA_FP_PASTA_H_
#define SHA256ZK_LIB_ALGEBRA_FP_PASTA_H_

/*
This file declares the one instance of the Pallas base field, the scalar
field of the Vesta curve:

p = 0x40000000000000000000000000000000224698fc094cf91b992d30ed00000001
  = 2^254 + 45560315531419706090280762371685220353

Every value written by the SHA-256 gadget is below 2^64 and every gate
identity stays below 2^67, so arithmetic in this field never wraps for
honest witnesses.
*/

#include "algebra/fp_generic.h"

namespace sha256zk {

using FpPallas = FpGeneric<4>;

extern const FpPallas pallas_base;

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_ALGEBRA_FP_PASTA_H_
