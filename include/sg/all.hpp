#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "sg/core/config.hpp"
#include "sg/core/value.hpp"
#include "sg/ops/graph.hpp"

// Ops
#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"
#include "sg/ops/reduce.hpp"

// NN
#include "sg/nn/module.hpp"
#include "sg/nn/layers/neuron.hpp"
#include "sg/nn/layers/dense.hpp"
#include "sg/nn/mlp.hpp"
#include "sg/nn/loss.hpp"
#include "sg/nn/optim/sgd.hpp"

// End of umbrella
