#pragma once
#include "sl/data/BarSeries.hpp"
#include "sl/data/DataError.hpp"
#include "sl/layout/ChartViewport.hpp"
#include "sl/math/NiceTicks.hpp"

#include <cstddef>
#include <vector>

namespace sl {

// Fixed layout constants.
inline constexpr double kBandPadding = 0.3;       // inner and outer band padding
inline constexpr double kPriceLowPad = 0.98;
inline constexpr double kPriceHighPad = 1.02;
inline constexpr double kVolumeHeadroom = 1.2;

// Ordinal band mapping: one uniform band per bar, centered in the range.
struct BandScale {
  std::size_t count{0};
  double rangeStart{0}, rangeEnd{0};
  double start{0};      // left edge of band 0
  double step{0};       // distance between band starts
  double bandwidth{0};

  double x(std::size_t i) const { return start + step * static_cast<double>(i); }
  double center(std::size_t i) const { return x(i) + bandwidth * 0.5; }
};

BandScale makeBandScale(std::size_t count, double r0, double r1,
                        double padding = kBandPadding);

// Linear mapping domain [d0, d1] -> range [r0, r1]. A zero-width domain
// maps everything to the middle of the range.
struct LinearScale {
  double d0{0}, d1{1};
  double r0{0}, r1{1};

  double operator()(double v) const;
  double invert(double r) const;
  TickSet ticks(int count) const { return computeNiceTicks(d0, d1, count); }
};

struct Scales {
  PaneLayout layout;
  BandScale time;
  LinearScale price;
  LinearScale volume;

  double bandwidth() const { return time.bandwidth; }
};

struct ScalesResult {
  bool ok{false};
  DataError err;
  Scales scales;
};

// Pure function of (bars, viewport). Fails with EMPTY_SERIES on zero bars
// and with UNORDERED_SERIES / DUPLICATE_TIME on ordering violations.
ScalesResult computeScales(const std::vector<Bar>& bars, const ChartViewport& vp,
                           double volumeFraction = kDefaultVolumeFraction);

inline ScalesResult computeScales(const BarSeries& series, const ChartViewport& vp,
                                  double volumeFraction = kDefaultVolumeFraction) {
  return computeScales(series.bars(), vp, volumeFraction);
}

} // namespace sl
