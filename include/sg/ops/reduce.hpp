#pragma once
#include "sg/core/value.hpp"
#include <vector>

namespace sg {

// Left fold with add: ((v0 + v1) + v2) + ...
Value sum(const std::vector<Value>& xs);
// sum(xs) * (1 / n)
Value mean(const std::vector<Value>& xs);

} // namespace sg
