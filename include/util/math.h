#pragma once

#include <cmath>
#include <optional>
#include <vector>

// A figure that may be absent. Never encode "missing" as zero or NaN.
using Value = std::optional<double>;
using Series = std::vector<Value>;

inline Value finite_or_none(double x) {
  return std::isfinite(x) ? Value{x} : std::nullopt;
}

inline Value safe_div(Value num, Value den) {
  if (!num || !den || *den == 0.0)
    return std::nullopt;
  return finite_or_none(*num / *den);
}

inline Value scaled(Value v, double factor) {
  return v ? finite_or_none(*v * factor) : std::nullopt;
}
