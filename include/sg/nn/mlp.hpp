#pragma once
#include "sg/nn/module.hpp"
#include "sg/nn/layers/dense.hpp"
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

namespace sg::nn {

// Stack of Dense layers sizes[0] -> sizes[1] -> ... -> sizes.back().
// Hidden layers are rectified when hidden_relu is set; the output layer is linear.
struct MLP : Module {
  std::vector<std::shared_ptr<Dense>> layers;

  explicit MLP(const std::vector<std::size_t>& sizes, bool hidden_relu = false,
               std::uint64_t seed = config::default_seed());

  std::vector<Value> forward(const std::vector<Value>& x) override;

  // "layer" header per layer, then "w=[...], b=..." per neuron.
  void dump(std::ostream& os = std::cout) const;
};

} // namespace sg::nn
