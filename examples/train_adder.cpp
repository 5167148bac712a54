// examples/train_adder.cpp: a 2 -> 1 network learns y = x0 + x1
// - Fixed five-sample dataset, full-batch MSE each iteration
// - Prints the loss every iteration, then the learned weights and a test prediction
// - SG_STEPS / SG_LR override the iteration count and learning rate

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sg/core/value.hpp"
#include "sg/ops/arithmetic.hpp"
#include "sg/ops/graph.hpp"
#include "sg/nn/mlp.hpp"
#include "sg/nn/loss.hpp"
#include "sg/nn/optim/sgd.hpp"

// Plain decimal only; stoull would accept "-5" and wrap it.
static std::size_t env_size(const char* name, std::size_t def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  const std::string text(s);
  if (text.find_first_not_of("0123456789") != std::string::npos) {
    std::cerr << "ignoring " << name << "=" << s << "\n";
    return def;
  }
  try { return static_cast<std::size_t>(std::stoull(text)); }
  catch (const std::exception&) {
    std::cerr << "ignoring " << name << "=" << s << "\n";
    return def;
  }
}

static double env_double(const char* name, double def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  try { return std::stod(s); }
  catch (const std::exception&) {
    std::cerr << "ignoring " << name << "=" << s << "\n";
    return def;
  }
}

int main() {
  using sg::constant;

  const std::size_t steps = env_size("SG_STEPS", 1000);
  const double lr = env_double("SG_LR", 1e-4);

  const std::vector<std::vector<double>> xs = {
    {5.0, 5.0}, {4.0, 3.0}, {10.0, 3.0}, {-15.0, 3.0}, {-5.0, 3.0},
  };
  const std::vector<double> ys = {10.0, 7.0, 13.0, -12.0, -2.0};

  sg::nn::MLP net({2, 1});
  sg::nn::SGD opt(lr);

  for (std::size_t step = 0; step < steps; ++step) {
    std::vector<sg::Value> predicted, targets;
    for (std::size_t i = 0; i < xs.size(); ++i) {
      predicted.push_back(net.forward({constant(xs[i][0]), constant(xs[i][1])})[0]);
      targets.push_back(constant(ys[i]));
    }
    auto loss = sg::nn::mse_loss(predicted, targets);
    std::cout << "loss=" << loss.value() << "\n";
    loss.compute_gradients();
    opt.step(net);
  }

  net.dump();

  sg::NoGradGuard no_grad;
  const auto out = net.forward({constant(9.0), constant(4.0)});
  std::cout << "9 + 4 = " << out[0].value() << std::endl;
  return 0;
}
