#include "sg/nn/loss.hpp"
#include "sg/ops/arithmetic.hpp"
#include "sg/ops/reduce.hpp"
#include <stdexcept>

namespace sg::nn {

Value mse_loss(const std::vector<Value>& predicted, const std::vector<Value>& targets) {
  if (predicted.size() != targets.size()) throw std::invalid_argument("mse_loss: predicted/targets size mismatch");
  if (predicted.empty()) throw std::invalid_argument("mse_loss: empty input");

  std::vector<Value> sq;
  sq.reserve(predicted.size());
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    sq.push_back(squared(sub(predicted[i], targets[i])));
  }
  return mean(sq);
}

} // namespace sg::nn
