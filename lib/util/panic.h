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

#ifndef SHA256ZK_LIB_UTIL_PANIC_H_
#define SHA256ZK_LIB_UTIL_PANIC_H_

namespace sha256zk {

// Aborts the process with a diagnostic if TRUTH is false.  Used for
// violations of internal invariants and for programming errors in the
// caller, never for data-dependent failures.
void check(bool truth, const char* why);

[[noreturn]] void fail(const char* why);

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_UTIL_PANIC_H_
