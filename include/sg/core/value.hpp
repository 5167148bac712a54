#pragma once
#include <iostream>
#include <memory>
#include <vector>

namespace sg {

// Global grad mode (thread-local). When off, ops return detached leaves.
inline thread_local bool g_grad_enabled = true;
inline bool is_grad_enabled() { return g_grad_enabled; }
inline void set_grad_enabled(bool v) { g_grad_enabled = v; }

enum class Op { None, Add, Mul, Pow, Relu };

const char* op_name(Op op);

struct Node {
  double value = 0.0;
  double grad  = 0.0;   // accumulator, reset by each propagation pass
  Op op = Op::None;

  // operands: [] for None, [x] for Relu, [lhs, rhs] / [base, exponent] otherwise
  std::vector<std::shared_ptr<Node>> parents;

  Node() = default;
  Node(const Node&) = default;
  Node& operator=(const Node&) = default;
  // Releases uniquely owned operands with a worklist, so dropping a deep
  // graph does not recurse once per level.
  ~Node();
};

class Value {
public:
  Value();                                      // leaf 0.0
  explicit Value(double value);                 // leaf
  explicit Value(std::shared_ptr<Node> node);   // wrap existing, throws on null

  double value() const;
  double grad()  const;
  Op op() const;
  bool is_leaf() const;
  const std::vector<std::shared_ptr<Node>>& parents() const;

  // Reset, seed this node with 1, then push derivatives to every reachable node.
  // One reverse-topological pass: a node pushes to its operands only after all
  // of its consumers are done. For a shared interior node (y = x*x; z = y + y)
  // this gives the chain-rule total dz/dx = 4x. A walk that re-descends once
  // per path would re-push y's operands per consumer and report 8x.
  void compute_gradients();
  // Reset phase only.
  void zero_grad();

  // One gradient-descent step on this node: value -= grad * learning_rate.
  // Before any compute_gradients() the gradient is 0 and this is a no-op.
  void update(double learning_rate);

  void dump(std::ostream& os = std::cout) const;

  // expose node handle for ops implementation
  std::shared_ptr<Node> n;
};

Value make_from_node(std::shared_ptr<Node> node);

// Reachable nodes, operands before consumers (root last).
std::vector<Node*> topo_order(const std::shared_ptr<Node>& root);

} // namespace sg
