#include "sl/interaction/HitRegions.hpp"
#include <algorithm>

namespace sl {

HitRegions::HitRegions(const Scales& scales) {
  build(scales);
}

void HitRegions::clear() {
  regions_.clear();
  edges_.clear();
  plot_ = PlotArea{};
}

void HitRegions::build(const Scales& scales) {
  clear();
  const std::size_t n = scales.time.count;
  if (n == 0) return;

  plot_ = scales.layout.plot;
  edges_.reserve(n + 1);
  edges_.push_back(plot_.left);
  for (std::size_t i = 1; i < n; i++) {
    edges_.push_back((scales.time.center(i - 1) + scales.time.center(i)) * 0.5);
  }
  edges_.push_back(plot_.right);

  regions_.reserve(n);
  for (std::size_t i = 0; i < n; i++) {
    HitRegion r;
    r.index = i;
    r.x0 = edges_[i];
    r.x1 = edges_[i + 1];
    r.top = plot_.top;
    r.bottom = plot_.bottom;
    r.centerX = scales.time.center(i);
    regions_.push_back(r);
  }
}

std::optional<std::size_t> HitRegions::regionAt(double x, double y) const {
  if (regions_.empty() || !plot_.contains(x, y)) return std::nullopt;

  // First edge strictly greater than x; the region is the one before it.
  auto it = std::upper_bound(edges_.begin() + 1, edges_.end(), x);
  if (it == edges_.end()) return regions_.size() - 1;
  return static_cast<std::size_t>(it - edges_.begin()) - 1;
}

} // namespace sl
