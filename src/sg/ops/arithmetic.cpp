#include "sg/ops/arithmetic.hpp"
#include "sg/ops/graph.hpp"
#include <cmath>

namespace sg {
using detail::make_node;

Value constant(double x) {
  return Value(x);
}

Value add(const Value& A, const Value& B) {
  return make_from_node(make_node(A.n->value + B.n->value, Op::Add, {A.n, B.n}));
}

Value sub(const Value& A, const Value& B) {
  return add(A, mul(B, constant(-1.0)));
}

Value mul(const Value& A, const Value& B) {
  return make_from_node(make_node(A.n->value * B.n->value, Op::Mul, {A.n, B.n}));
}

Value pow(const Value& base, const Value& exponent) {
  const double v = std::pow(base.n->value, exponent.n->value);
  return make_from_node(make_node(v, Op::Pow, {base.n, exponent.n}));
}

Value squared(const Value& x) {
  return pow(x, constant(2.0));
}

} // namespace sg
