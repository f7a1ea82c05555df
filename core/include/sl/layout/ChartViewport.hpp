#pragma once

namespace sl {

struct Margins {
  double top{20};
  double right{60};
  double bottom{30};
  double left{60};
};

// Canvas size in pixels. Owned by the lifecycle controller and changed
// only through resize.
struct ChartViewport {
  double width{800};
  double height{510};
  Margins margins;
};

struct PlotArea {
  double left{0}, right{0}, top{0}, bottom{0};

  double width() const { return right - left; }
  double height() const { return bottom - top; }
  bool containsX(double x) const { return x >= left && x <= right; }
  bool containsY(double y) const { return y >= top && y <= bottom; }
  bool contains(double x, double y) const { return containsX(x) && containsY(y); }
};

// Vertical split of the plot: price pane on top, volume pane below,
// separated by a fixed gap.
struct PaneLayout {
  PlotArea plot;
  double priceTop{0}, priceBottom{0};
  double volumeTop{0}, volumeBottom{0};
};

inline constexpr double kPaneGap = 40.0;
inline constexpr double kDefaultVolumeFraction = 0.24;

// Degenerate viewports clamp to a 1-pixel plot rather than failing.
PaneLayout computePaneLayout(const ChartViewport& vp,
                             double volumeFraction = kDefaultVolumeFraction);

} // namespace sl
