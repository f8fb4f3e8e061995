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

#ifndef SHA256ZK_LIB_PLONK_EXPRESSION_H_
#define SHA256ZK_LIB_PLONK_EXPRESSION_H_

#include <stddef.h>

#include <algorithm>
#include <memory>

#include "plonk/circuit.h"

namespace sha256zk {

// Polynomial over the cells of the grid, relative to the row at which it
// is evaluated.  Nodes are immutable and shared, so copying an expression
// is cheap and subexpressions may appear in several constraints.
template <class Field>
class Expression {
 public:
  using Elt = typename Field::Elt;

  enum Kind {
    kConstant,
    kSelector,
    kFixed,
    kAdvice,
    kInstance,
    kNegated,
    kSum,
    kProduct
  };

  // The zero constant.
  Expression() : node_(std::make_shared<const Node>(kConstant)) {}

  static Expression constant(const Elt& k) {
    auto n = std::make_shared<Node>(kConstant);
    n->k = k;
    return Expression(n);
  }

  static Expression selector(const Selector& s) {
    auto n = std::make_shared<Node>(kSelector);
    n->index = s.index;
    return Expression(n);
  }

  static Expression query(const Column& c, Rotation rot) {
    Kind kind = kAdvice;
    switch (c.kind) {
      case ColumnKind::kAdvice:
        kind = kAdvice;
        break;
      case ColumnKind::kFixed:
        kind = kFixed;
        break;
      case ColumnKind::kInstance:
        kind = kInstance;
        break;
    }
    auto n = std::make_shared<Node>(kind);
    n->index = c.index;
    n->rot = rot;
    return Expression(n);
  }

  Kind kind() const { return node_->kind; }

  size_t degree() const {
    const Node& n = *node_;
    switch (n.kind) {
      case kConstant:
        return 0;
      case kSelector:
      case kFixed:
      case kAdvice:
      case kInstance:
        return 1;
      case kNegated:
        return Expression(n.a).degree();
      case kSum:
        return std::max(Expression(n.a).degree(), Expression(n.b).degree());
      case kProduct:
        return Expression(n.a).degree() + Expression(n.b).degree();
    }
    return 0;
  }

  // Evaluates the expression.  Q supplies the leaves:
  //   Elt q.selector(size_t index)
  //   Elt q.fixed(size_t index, Rotation)
  //   Elt q.advice(size_t index, Rotation)
  //   Elt q.instance(size_t index, Rotation)
  template <class Q>
  Elt evaluate(const Field& F, Q& q) const {
    const Node& n = *node_;
    switch (n.kind) {
      case kConstant:
        return n.k;
      case kSelector:
        return q.selector(n.index);
      case kFixed:
        return q.fixed(n.index, n.rot);
      case kAdvice:
        return q.advice(n.index, n.rot);
      case kInstance:
        return q.instance(n.index, n.rot);
      case kNegated:
        return F.negf(Expression(n.a).evaluate(F, q));
      case kSum:
        return F.addf(Expression(n.a).evaluate(F, q),
                      Expression(n.b).evaluate(F, q));
      case kProduct:
        return F.mulf(Expression(n.a).evaluate(F, q),
                      Expression(n.b).evaluate(F, q));
    }
    return F.zero();
  }

  friend Expression operator+(const Expression& a, const Expression& b) {
    return binary(kSum, a, b);
  }
  friend Expression operator*(const Expression& a, const Expression& b) {
    return binary(kProduct, a, b);
  }
  friend Expression operator-(const Expression& a) {
    auto n = std::make_shared<Node>(kNegated);
    n->a = a.node_;
    return Expression(n);
  }
  friend Expression operator-(const Expression& a, const Expression& b) {
    return a + (-b);
  }

 private:
  struct Node {
    explicit Node(Kind kind) : kind(kind), k{}, index(0), rot(0) {}
    Kind kind;
    Elt k;
    size_t index;
    Rotation rot;
    std::shared_ptr<const Node> a, b;
  };

  explicit Expression(std::shared_ptr<const Node> n) : node_(std::move(n)) {}

  static Expression binary(Kind kind, const Expression& a,
                           const Expression& b) {
    auto n = std::make_shared<Node>(kind);
    n->a = a.node_;
    n->b = b.node_;
    return Expression(n);
  }

  std::shared_ptr<const Node> node_;
};

}  // namespace sha256zk

#endif  // SHA256ZK_LIB_PLONK_EXPRESSION_H_
