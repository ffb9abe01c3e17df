#pragma once

#include <algorithm>
#include <cmath>

// 1 at the target, falling linearly to 0 at a relative miss of 100%.
inline double closeness_score(double observed, double target) {
  if (target == 0.0)
    return observed == 0.0 ? 1.0 : 0.0;
  return std::clamp(1.0 - std::abs(observed - target) / target, 0.0, 1.0);
}

inline bool in_band(double observed, double lo, double hi) {
  return observed >= lo && observed <= hi;
}
