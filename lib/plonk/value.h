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

#ifndef SHA256ZK_LIB_PLONK_VALUE_H_
#define SHA256ZK_LIB_PLONK_VALUE_H_

#include <optional>
#include <type_traits>
#include <utility>

#include "util/panic.h"

namespace sha256zk {

// A witness value that may be unknown.  Circuits are synthesized twice:
// once without witnesses to fix the layout, where every Value is unknown,
// and once with a concrete input, where every Value is known.  Gadget code
// must only combine values through map() and lift() so that it runs
// unchanged in both passes.
template <class T>
class Value {
 public:
  Value() = default;

  static Value known(T v) { return Value(std::move(v)); }
  static Value unknown() { return Value(); }

  bool is_known() const { return v_.has_value(); }

  const T& get() const {
    check(v_.has_value(), "Value::get() on an unknown value");
    return *v_;
  }

  template <class F>
  auto map(F f) const -> Value<std::decay_t<decltype(f(std::declval<const T&>()))>> {
    using U = std::decay_t<decltype(f(std::declval<const T&>()))>;
    if (!v_.has_value()) return Value<U>::unknown();
    return Value<U>::known(f(*v_));
  }

 private:
  explicit Value(T v) : v_(std::move(v)) {}

  std::optional<T> v_;
};

// Applies F to the contents of all arguments, or yields unknown if any
// argument is unknown.
template <class F, class... T>
auto lift(F f, const Value<T>&... v)
    -> Value<std::decay_t<decltype(f(v.get()...))>> {
  using U = std::decay_t<decltype(f(v.get()...))>;
  if (!(v.is_known() && ...)) return Value<U>::unknown();
  return Value<U>::known(f(v.get()...));
}

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_VALUE_H_
