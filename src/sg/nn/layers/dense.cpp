#include "sg/nn/layers/dense.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace sg::nn {

Dense::Dense(std::size_t in_features, std::size_t out_features, bool relu, std::uint64_t seed)
: in_features_(in_features) {
  if (out_features == 0) throw std::invalid_argument("Dense: out_features must be > 0");
  neurons_.reserve(out_features);
  for (std::size_t j = 0; j < out_features; ++j) {
    auto neuron = std::make_shared<Neuron>(in_features, relu, seed + j);
    register_module("neuron" + std::to_string(j), neuron);
    neurons_.push_back(std::move(neuron));
  }
}

std::vector<Value> Dense::forward(const std::vector<Value>& x) {
  if (x.size() != in_features_) {
    throw std::invalid_argument("Dense: expected " + std::to_string(in_features_) +
                                " inputs, got " + std::to_string(x.size()));
  }
  std::vector<Value> out;
  out.reserve(neurons_.size());
  for (auto& neuron : neurons_) out.push_back(neuron->activate(x));
  return out;
}

} // namespace sg::nn
