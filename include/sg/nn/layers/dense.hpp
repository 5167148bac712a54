// ============================
// File: include/sg/nn/layers/dense.hpp
// ============================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "sg/nn/module.hpp"
#include "sg/nn/layers/neuron.hpp"

namespace sg::nn {

// A fully-connected layer: `out_features` neurons reading the same inputs.
// Neuron j is seeded with seed + j.
class Dense : public Module {
public:
  Dense(std::size_t in_features, std::size_t out_features, bool relu = false,
        std::uint64_t seed = config::default_seed());

  std::vector<Value> forward(const std::vector<Value>& x) override;

  std::size_t in_features()  const { return in_features_; }
  std::size_t out_features() const { return neurons_.size(); }
  const std::vector<std::shared_ptr<Neuron>>& neurons() const { return neurons_; }

private:
  std::size_t in_features_ = 0;
  std::vector<std::shared_ptr<Neuron>> neurons_;
};

} // namespace sg::nn
