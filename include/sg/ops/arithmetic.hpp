#pragma once
#include "sg/core/value.hpp"

namespace sg {

// Leaf node holding x.
Value constant(double x);

Value add(const Value& a, const Value& b);
// a + b * (-1); expands to two extra nodes, no rule of its own.
Value sub(const Value& a, const Value& b);
Value mul(const Value& a, const Value& b);
// base ** exponent. Only the base receives a gradient.
// Negative base with a fractional exponent gives NaN.
Value pow(const Value& base, const Value& exponent);
Value squared(const Value& x);

} // namespace sg
