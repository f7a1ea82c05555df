#include "sl/math/NiceTicks.hpp"
#include <cmath>
#include <utility>

namespace sl {

namespace {

const double kE10 = std::sqrt(50.0);
const double kE5 = std::sqrt(10.0);
const double kE2 = std::sqrt(2.0);

// Positive result: a tick step. Negative result: -(1/step) for sub-unit
// steps, so tick values can be formed by division without drift.
double tickIncrement(double lo, double hi, int count) {
  double step = (hi - lo) / static_cast<double>(count);
  double power = std::floor(std::log10(step));
  double error = step / std::pow(10.0, power);
  double factor = error >= kE10 ? 10.0 : error >= kE5 ? 5.0 : error >= kE2 ? 2.0 : 1.0;
  if (power >= 0) return factor * std::pow(10.0, power);
  return -std::pow(10.0, -power) / factor;
}

} // namespace

TickSet computeNiceTicks(double lo, double hi, int targetCount) {
  TickSet result;
  if (targetCount < 1) targetCount = 1;
  if (!std::isfinite(lo) || !std::isfinite(hi)) return result;

  if (hi < lo) std::swap(lo, hi);
  result.min = lo;
  result.max = hi;
  if (hi == lo) {
    result.step = 0.0;
    result.values.push_back(lo);
    return result;
  }

  double inc = tickIncrement(lo, hi, targetCount);
  if (inc > 0) {
    double i0 = std::ceil(lo / inc);
    double i1 = std::floor(hi / inc);
    result.step = inc;
    for (double i = i0; i <= i1; i += 1.0) result.values.push_back(i * inc);
  } else {
    double inv = -inc;
    double i0 = std::ceil(lo * inv);
    double i1 = std::floor(hi * inv);
    result.step = 1.0 / inv;
    for (double i = i0; i <= i1; i += 1.0) result.values.push_back(i / inv);
  }
  return result;
}

} // namespace sl
