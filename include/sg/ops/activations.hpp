#pragma once
#include "sg/core/value.hpp"

namespace sg {

// max(0, x); subgradient at exactly 0 is 0.
Value relu(const Value& x);

} // namespace sg
