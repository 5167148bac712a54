#include "sg/nn/optim/sgd.hpp"

namespace sg::nn {

void SGD::step(Module& m) {
  step(m.parameters());
}

void SGD::step(const std::vector<Value*>& params) {
  for (Value* p : params) {
    if (p) p->update(lr);
  }
}

} // namespace sg::nn
