#pragma once
#include "sg/core/value.hpp"
#include <vector>

namespace sg::nn {

// Mean squared error: mean_i((predicted_i - targets_i)^2). Returns a scalar node.
Value mse_loss(const std::vector<Value>& predicted, const std::vector<Value>& targets);

} // namespace sg::nn
