#include "sg/core/value.hpp"
#include "sg/core/config.hpp"
#include <cmath>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace {

// Local derivative rules. `node.grad` is final when this runs.
void propagate_local(sg::Node& node) {
  const double g = node.grad;
  switch (node.op) {
    case sg::Op::Add:
      for (auto& p : node.parents) p->grad += g;
      break;
    case sg::Op::Mul: {
      auto& lhs = node.parents[0];
      auto& rhs = node.parents[1];
      lhs->grad += rhs->value * g;
      rhs->grad += lhs->value * g;
      break;
    }
    case sg::Op::Pow: {
      // exponent is treated as non-differentiable
      auto& base = node.parents[0];
      const double e = node.parents[1]->value;
      base->grad += e * std::pow(base->value, e - 1.0) * g;
      break;
    }
    case sg::Op::Relu: {
      auto& x = node.parents[0];
      x->grad += x->value > 0.0 ? g : 0.0;
      break;
    }
    case sg::Op::None:
      break;
  }
}

} // anon

namespace sg {

const char* op_name(Op op) {
  switch (op) {
    case Op::None: return "leaf";
    case Op::Add:  return "add";
    case Op::Mul:  return "mul";
    case Op::Pow:  return "pow";
    case Op::Relu: return "relu";
  }
  return "?";
}

Node::~Node() {
  std::vector<std::shared_ptr<Node>> pending = std::move(parents);
  while (!pending.empty()) {
    std::shared_ptr<Node> p = std::move(pending.back());
    pending.pop_back();
    // last owner: take its operands before it dies so its own dtor is shallow
    if (p && p.use_count() == 1) {
      for (auto& q : p->parents) pending.push_back(std::move(q));
      p->parents.clear();
    }
  }
}

Value::Value() : n(std::make_shared<Node>()) {}

Value::Value(double value) : n(std::make_shared<Node>()) {
  n->value = value;
}

Value::Value(std::shared_ptr<Node> node) : n(std::move(node)) {
  if (!n) throw std::invalid_argument("Value: null node");
}

double Value::value() const { return n->value; }
double Value::grad()  const { return n->grad; }
Op Value::op() const { return n->op; }
bool Value::is_leaf() const { return n->op == Op::None; }
const std::vector<std::shared_ptr<Node>>& Value::parents() const { return n->parents; }

Value make_from_node(std::shared_ptr<Node> node) { return Value(std::move(node)); }

// Iterative post-order DFS; each node emitted once, after all its operands.
// Operands are entered right to left so that the reversed order visits
// consumers in left-first pre-order, the order a per-path recursive walk uses.
// Where only leaves are shared this makes every += land in the same sequence.
std::vector<Node*> topo_order(const std::shared_ptr<Node>& root) {
  std::vector<Node*> order;
  if (!root) return order;

  std::unordered_set<Node*> seen;
  std::vector<std::pair<Node*, std::size_t>> stack;  // (node, operands entered)
  stack.emplace_back(root.get(), 0);
  seen.insert(root.get());

  while (!stack.empty()) {
    Node* node = stack.back().first;
    const std::size_t done = stack.back().second;
    const std::size_t np = node->parents.size();
    if (done < np) {
      ++stack.back().second;
      Node* p = node->parents[np - 1 - done].get();
      if (p && seen.insert(p).second) stack.emplace_back(p, 0);
    } else {
      order.push_back(node);
      stack.pop_back();
    }
  }
  return order;
}

void Value::zero_grad() {
  for (Node* x : topo_order(n)) x->grad = 0.0;
}

void Value::compute_gradients() {
  const auto order = topo_order(n);
  for (Node* x : order) x->grad = 0.0;
  n->grad = 1.0;

  // Reverse topological order: every consumer of a node is done before the
  // node itself pushes to its operands, so shared nodes see the full sum.
  for (auto it = order.rbegin(); it != order.rend(); ++it) propagate_local(**it);
}

void Value::update(double learning_rate) {
  n->value -= n->grad * learning_rate;
}

void Value::dump(std::ostream& os) const {
  const auto order = topo_order(n);
  const auto flags = os.flags();
  const auto prec = os.precision(config::print_precision());
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    const Node* x = *it;
    os << std::setw(4) << op_name(x->op)
       << " value = " << x->value << ", gradient = " << x->grad << '\n';
  }
  os.precision(prec);
  os.flags(flags);
}

} // namespace sg
