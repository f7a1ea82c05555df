#include "sl/layout/Scales.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace sl {

BandScale makeBandScale(std::size_t count, double r0, double r1, double padding) {
  BandScale b;
  b.count = count;
  b.rangeStart = r0;
  b.rangeEnd = r1;
  const double n = static_cast<double>(count);
  // Inner and outer padding are equal; leftover space is split evenly.
  b.step = (r1 - r0) / std::max(1.0, n - padding + padding * 2.0);
  b.start = r0 + ((r1 - r0) - b.step * (n - padding)) * 0.5;
  b.bandwidth = b.step * (1.0 - padding);
  return b;
}

double LinearScale::operator()(double v) const {
  const double span = d1 - d0;
  if (span == 0.0) return (r0 + r1) * 0.5;
  return r0 + (v - d0) / span * (r1 - r0);
}

double LinearScale::invert(double r) const {
  const double span = r1 - r0;
  if (span == 0.0) return (d0 + d1) * 0.5;
  return d0 + (r - r0) / span * (d1 - d0);
}

ScalesResult computeScales(const std::vector<Bar>& bars, const ChartViewport& vp,
                           double volumeFraction) {
  ScalesResult r;
  if (bars.empty()) {
    r.err = {"EMPTY_SERIES", "cannot scale an empty series"};
    return r;
  }
  DataError order = checkOrdering(bars);
  if (!order.code.empty()) {
    r.err = std::move(order);
    return r;
  }

  double minLow = std::numeric_limits<double>::infinity();
  double maxHigh = -std::numeric_limits<double>::infinity();
  double maxVolume = 0.0;
  for (const Bar& b : bars) {
    minLow = std::min(minLow, b.low);
    maxHigh = std::max(maxHigh, b.high);
    maxVolume = std::max(maxVolume, b.volume);
  }

  Scales& s = r.scales;
  s.layout = computePaneLayout(vp, volumeFraction);
  s.time = makeBandScale(bars.size(), s.layout.plot.left, s.layout.plot.right);

  s.price.d0 = minLow * kPriceLowPad;
  s.price.d1 = maxHigh * kPriceHighPad;
  s.price.r0 = s.layout.priceBottom;
  s.price.r1 = s.layout.priceTop;

  s.volume.d0 = 0.0;
  s.volume.d1 = maxVolume * kVolumeHeadroom;
  s.volume.r0 = s.layout.volumeBottom;
  s.volume.r1 = s.layout.volumeTop;

  r.ok = true;
  return r;
}

} // namespace sl
