#include "sg/ops/activations.hpp"
#include "sg/ops/graph.hpp"

namespace sg {

Value relu(const Value& X) {
  const double v = X.n->value;
  return make_from_node(detail::make_node(v > 0.0 ? v : 0.0, Op::Relu, {X.n}));
}

} // namespace sg
