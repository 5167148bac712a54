// ============================
// File: include/sg/nn/optim/sgd.hpp
// ============================
#pragma once
#include <vector>
#include "sg/core/value.hpp"
#include "sg/nn/module.hpp"

namespace sg::nn {

// Plain gradient descent: p -= lr * grad(p) for every parameter.
// Gradients are whatever the last compute_gradients() left; they are not cleared.
struct SGD {
  double lr{1e-4};

  explicit SGD(double lr = 1e-4) : lr(lr) {}

  void step(Module& m);
  void step(const std::vector<Value*>& params);
};

} // namespace sg::nn
