#pragma once
#include <vector>

namespace sl {

struct TickSet {
  double min{0}, max{0}, step{0};
  std::vector<double> values;
};

// "Nice" tick values inside [lo, hi], about targetCount of them.
// Step snaps to {1, 2, 5} x 10^n; every value lies within the domain.
// A degenerate domain (lo == hi) yields the single value lo.
TickSet computeNiceTicks(double lo, double hi, int targetCount = 5);

} // namespace sl
