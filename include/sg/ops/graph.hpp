#pragma once
#include "sg/core/value.hpp"
#include <memory>

namespace sg {
// Returns a detached copy: same value, no parents.
Value stop_gradient(const Value& x);

Value detach(const Value& x);

// Turns grad mode off for the current thread; restores the previous mode.
struct NoGradGuard {
  NoGradGuard();
  ~NoGradGuard();
  NoGradGuard(const NoGradGuard&) = delete;
  NoGradGuard& operator=(const NoGradGuard&) = delete;
private:
  bool prev_;
};

namespace detail {
// Builds a derived node, or a plain leaf when grad mode is off.
std::shared_ptr<Node> make_node(double value, Op op,
                                std::vector<std::shared_ptr<Node>> parents);
} // namespace detail

} // namespace sg
