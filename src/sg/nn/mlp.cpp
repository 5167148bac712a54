#include "sg/nn/mlp.hpp"
#include "sg/core/config.hpp"
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace sg::nn {

MLP::MLP(const std::vector<std::size_t>& sizes, bool hidden_relu, std::uint64_t seed) {
  if (sizes.size() < 2) throw std::invalid_argument("MLP: need at least input and output sizes");
  for (std::size_t s : sizes) {
    if (s == 0) throw std::invalid_argument("MLP: layer sizes must be > 0");
  }

  // Per-layer seed stride keeps neuron seeds (seed + j inside Dense) distinct.
  std::uint64_t layer_seed = seed;
  for (std::size_t i = 0; i + 1 < sizes.size(); ++i) {
    const bool last = (i + 2 == sizes.size());
    auto layer = std::make_shared<Dense>(sizes[i], sizes[i + 1], hidden_relu && !last, layer_seed);
    register_module("layer" + std::to_string(i), layer);
    layers.push_back(std::move(layer));
    layer_seed += sizes[i + 1];
  }
}

std::vector<Value> MLP::forward(const std::vector<Value>& x) {
  std::vector<Value> y = x;
  for (auto& layer : layers) y = layer->forward(y);
  return y;
}

void MLP::dump(std::ostream& os) const {
  const auto prec = os.precision(config::print_precision());
  for (const auto& layer : layers) {
    os << "layer\n";
    for (const auto& neuron : layer->neurons()) {
      os << "w=[";
      const auto& ws = neuron->weights();
      for (std::size_t i = 0; i < ws.size(); ++i) os << (i ? ", " : "") << ws[i].value();
      os << "], b=" << neuron->bias().value() << '\n';
    }
  }
  os.precision(prec);
}

} // namespace sg::nn
