#include "sg/ops/graph.hpp"
#include <utility>

namespace sg {

Value stop_gradient(const Value& x) {
  auto n = std::make_shared<Node>();
  n->value = x.n->value;
  return make_from_node(n);
}

Value detach(const Value& x) {
  return stop_gradient(x);
}

NoGradGuard::NoGradGuard() : prev_(sg::is_grad_enabled()) { sg::set_grad_enabled(false); }
NoGradGuard::~NoGradGuard() { sg::set_grad_enabled(prev_); }

namespace detail {

std::shared_ptr<Node> make_node(double value, Op op,
                                std::vector<std::shared_ptr<Node>> parents) {
  auto out = std::make_shared<Node>();
  out->value = value;
  if (sg::is_grad_enabled()) {
    out->op = op;
    out->parents = std::move(parents);
  }
  return out;
}

} // namespace detail
} // namespace sg
