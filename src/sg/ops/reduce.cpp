#include "sg/ops/reduce.hpp"
#include "sg/ops/arithmetic.hpp"
#include <stdexcept>

namespace sg {

Value sum(const std::vector<Value>& xs) {
  if (xs.empty()) throw std::invalid_argument("sum: empty input");
  Value acc = xs.front();
  for (std::size_t i = 1; i < xs.size(); ++i) acc = add(acc, xs[i]);
  return acc;
}

Value mean(const std::vector<Value>& xs) {
  if (xs.empty()) throw std::invalid_argument("mean: empty input");
  const Value inv_n = constant(1.0 / static_cast<double>(xs.size()));
  return mul(sum(xs), inv_n);
}

} // namespace sg
