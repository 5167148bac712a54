#include "sg/nn/layers/neuron.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"
#include <stdexcept>
#include <string>

namespace sg::nn {

Neuron::Neuron(std::size_t in_features, bool relu, std::uint64_t seed)
: relu_(relu) {
  if (in_features == 0) throw std::invalid_argument("Neuron: in_features must be > 0");

  // last draw is the bias
  const auto init = randu_(in_features + 1, seed);
  weights_.reserve(in_features);
  for (std::size_t i = 0; i < in_features; ++i) weights_.emplace_back(init[i]);
  bias_ = constant(init[in_features]);

  for (std::size_t i = 0; i < in_features; ++i) {
    register_parameter("w" + std::to_string(i), weights_[i]);
  }
  register_parameter("b", bias_);
}

Value Neuron::activate(const std::vector<Value>& x) const {
  if (x.size() != weights_.size()) {
    throw std::invalid_argument("Neuron: expected " + std::to_string(weights_.size()) +
                                " inputs, got " + std::to_string(x.size()));
  }
  Value acc = mul(weights_[0], x[0]);
  for (std::size_t i = 1; i < x.size(); ++i) acc = add(acc, mul(weights_[i], x[i]));
  acc = add(acc, bias_);
  return relu_ ? relu(acc) : acc;
}

std::vector<Value> Neuron::forward(const std::vector<Value>& x) {
  return { activate(x) };
}

} // namespace sg::nn
