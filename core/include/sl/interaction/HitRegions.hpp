#pragma once
#include "sl/layout/Scales.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace sl {

struct HitRegion {
  std::size_t index{0};
  double x0{0}, x1{0};
  double top{0}, bottom{0};
  double centerX{0};
};

// One region per bar. Neighbouring regions meet halfway between band
// centers, the first and last extend to the plot edges, so the regions tile
// the plot width with no gaps or overlaps. Intervals are [x0, x1) except
// the last, which is closed. Interior regions are one time step wide, which
// is 1 / (1 - kBandPadding) times the visible body width.
class HitRegions {
public:
  HitRegions() = default;
  explicit HitRegions(const Scales& scales);

  void build(const Scales& scales);
  void clear();

  std::optional<std::size_t> regionAt(double x, double y) const;

  std::size_t size() const { return regions_.size(); }
  bool empty() const { return regions_.empty(); }
  const HitRegion& operator[](std::size_t i) const { return regions_[i]; }
  const std::vector<HitRegion>& regions() const { return regions_; }

  // size() + 1 edges, plot.left first and plot.right last.
  const std::vector<double>& boundaries() const { return edges_; }

private:
  std::vector<HitRegion> regions_;
  std::vector<double> edges_;
  PlotArea plot_;
};

} // namespace sl
