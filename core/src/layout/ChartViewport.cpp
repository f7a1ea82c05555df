#include "sl/layout/ChartViewport.hpp"
#include <algorithm>

namespace sl {

PaneLayout computePaneLayout(const ChartViewport& vp, double volumeFraction) {
  PaneLayout pl;
  pl.plot.left = vp.margins.left;
  pl.plot.right = std::max(vp.margins.left + 1.0, vp.width - vp.margins.right);
  pl.plot.top = vp.margins.top;
  pl.plot.bottom = std::max(vp.margins.top + 1.0, vp.height - vp.margins.bottom);

  volumeFraction = std::clamp(volumeFraction, 0.0, 0.9);
  const double plotH = pl.plot.height();
  const double volH = plotH * volumeFraction;
  const double gap = std::min(kPaneGap, std::max(0.0, plotH - volH - 1.0));

  pl.volumeBottom = pl.plot.bottom;
  pl.volumeTop = pl.plot.bottom - volH;
  pl.priceTop = pl.plot.top;
  pl.priceBottom = std::max(pl.plot.top + 1.0, pl.volumeTop - gap);
  return pl;
}

} // namespace sl
