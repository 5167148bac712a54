// ============================
// File: include/sg/nn/layers/neuron.hpp
// ============================
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "sg/nn/module.hpp"
#include "sg/core/config.hpp"
#include "sg/core/value.hpp"

namespace sg::nn {

// A single unit: y = sum_i(w_i * x_i) + b, optionally rectified.
// Weights and bias start in U(-1, 1).
class Neuron : public Module {
public:
  explicit Neuron(std::size_t in_features, bool relu = false,
                  std::uint64_t seed = config::default_seed());

  // One-element vector holding activate(x).
  std::vector<Value> forward(const std::vector<Value>& x) override;
  Value activate(const std::vector<Value>& x) const;

  std::size_t in_features() const { return weights_.size(); }
  bool has_relu() const { return relu_; }
  const std::vector<Value>& weights() const { return weights_; }
  const Value& bias() const { return bias_; }

private:
  static std::vector<double> randu_(std::size_t n, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    std::vector<double> v(n);
    for (auto& t : v) t = dist(rng);
    return v;
  }

  bool relu_ = false;
  std::vector<Value> weights_;  // [In], sized once in the constructor
  Value bias_;
};

} // namespace sg::nn
