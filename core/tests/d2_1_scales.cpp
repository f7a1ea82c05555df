// D2.1 - Pane layout and scales
// Tests: default pane split, band scale geometry, price/volume domains for
// the two-bar reference series, empty/unordered rejection, degenerate
// viewports, volume fraction override.

#include "sl/data/BarSeries.hpp"
#include "sl/layout/ChartViewport.hpp"
#include "sl/layout/Scales.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static sl::Bar makeBar(const char* day, double o, double h, double l, double c, double v) {
  sl::Bar b;
  b.time = day;
  b.open = o;
  b.high = h;
  b.low = l;
  b.close = c;
  b.volume = v;
  return b;
}

static std::vector<sl::Bar> twoBars() {
  return {makeBar("2024-01-02", 100, 105, 99, 104, 1000),
          makeBar("2024-01-03", 104, 106, 101, 102, 1500)};
}

int main() {
  // ---- Test 1: default pane layout ----
  {
    sl::ChartViewport vp;
    sl::PaneLayout pl = sl::computePaneLayout(vp);
    requireNear(pl.plot.left, 60, 1e-9, "plot left");
    requireNear(pl.plot.right, 740, 1e-9, "plot right");
    requireNear(pl.plot.top, 20, 1e-9, "plot top");
    requireNear(pl.plot.bottom, 480, 1e-9, "plot bottom");
    requireNear(pl.volumeBottom, 480, 1e-9, "volume bottom");
    requireNear(pl.volumeTop, 480 - 460 * 0.24, 1e-9, "volume top");
    requireNear(pl.priceTop, 20, 1e-9, "price top");
    requireNear(pl.priceBottom, pl.volumeTop - sl::kPaneGap, 1e-9, "gap between panes");
    requireTrue(pl.priceBottom < pl.volumeTop, "panes do not overlap");

    std::printf("  Test 1 (pane layout) PASS\n");
  }

  // ---- Test 2: band scale ----
  {
    sl::BandScale b = sl::makeBandScale(2, 60, 740);
    const double step = 680 / 2.3;
    requireNear(b.step, step, 1e-9, "step");
    requireNear(b.bandwidth, step * 0.7, 1e-9, "bandwidth");
    requireNear(b.x(0) - 60, 740 - (b.x(1) + b.bandwidth), 1e-9, "outer padding symmetric");
    requireNear(b.x(0) - 60, step * 0.3, 1e-9, "outer padding is one padding step");
    requireNear((b.center(0) + b.center(1)) * 0.5, 400, 1e-9, "bands centered");

    sl::BandScale one = sl::makeBandScale(1, 60, 740);
    requireNear(one.center(0), 400, 1e-9, "single band centered");
    requireNear(one.bandwidth, 680 / 1.3 * 0.7, 1e-9, "single band width");

    std::printf("  Test 2 (band scale) PASS\n");
  }

  // ---- Test 3: reference series domains ----
  {
    sl::ScalesResult r = sl::computeScales(twoBars(), sl::ChartViewport{});
    requireTrue(r.ok, "scales computed");
    const sl::Scales& s = r.scales;
    requireNear(s.price.d0, 97.02, 1e-9, "price domain low = 99 * 0.98");
    requireNear(s.price.d1, 108.12, 1e-9, "price domain high = 106 * 1.02");
    requireNear(s.price(97.02), s.layout.priceBottom, 1e-9, "low maps to pane bottom");
    requireNear(s.price(108.12), s.layout.priceTop, 1e-9, "high maps to pane top");
    requireTrue(s.price(105) < s.price(100), "y grows downward");
    requireNear(s.price.invert(s.price(101.5)), 101.5, 1e-9, "invert");

    requireNear(s.volume.d0, 0, 1e-12, "volume domain starts at 0");
    requireNear(s.volume.d1, 1800, 1e-9, "volume domain = max * 1.2");
    requireNear(s.volume(0), s.layout.volumeBottom, 1e-9, "zero volume at pane bottom");
    requireNear(s.volume(1800), s.layout.volumeTop, 1e-9, "max at pane top");

    requireTrue(s.time.count == 2, "one band per bar");
    requireNear(s.bandwidth(), s.time.bandwidth, 0, "bandwidth accessor");

    sl::TickSet pt = s.price.ticks(6);
    requireTrue(pt.values.size() == 6, "six price ticks");
    requireNear(pt.values.front(), 98, 1e-9, "first price tick");
    requireNear(pt.values.back(), 108, 1e-9, "last price tick");

    sl::TickSet vt = s.volume.ticks(3);
    requireTrue(vt.values.size() == 4, "four volume ticks");
    requireNear(vt.step, 500, 1e-9, "volume tick step");

    std::printf("  Test 3 (reference domains) PASS\n");
  }

  // ---- Test 4: rejection ----
  {
    sl::ScalesResult r = sl::computeScales(std::vector<sl::Bar>{}, sl::ChartViewport{});
    requireTrue(!r.ok && r.err.code == "EMPTY_SERIES", "empty rejected");

    std::vector<sl::Bar> bars = twoBars();
    std::swap(bars[0], bars[1]);
    r = sl::computeScales(bars, sl::ChartViewport{});
    requireTrue(!r.ok && r.err.code == "UNORDERED_SERIES", "unordered rejected");

    bars[1].time = bars[0].time;
    r = sl::computeScales(bars, sl::ChartViewport{});
    requireTrue(!r.ok && r.err.code == "DUPLICATE_TIME", "duplicate rejected");

    std::printf("  Test 4 (rejection) PASS\n");
  }

  // ---- Test 5: degenerate viewport and flat series ----
  {
    sl::ChartViewport tiny;
    tiny.width = 50;
    tiny.height = 20;
    sl::ScalesResult r = sl::computeScales(twoBars(), tiny);
    requireTrue(r.ok, "tiny viewport still scales");
    requireNear(r.scales.layout.plot.width(), 1, 1e-9, "plot clamps to 1px wide");
    requireTrue(r.scales.layout.plot.height() >= 1, "plot at least 1px tall");
    requireTrue(std::isfinite(r.scales.time.center(1)), "finite band centers");

    std::vector<sl::Bar> flat = {makeBar("2024-01-02", 10, 10, 10, 10, 0)};
    r = sl::computeScales(flat, sl::ChartViewport{});
    requireTrue(r.ok, "flat series scales");
    requireTrue(std::isfinite(r.scales.volume(0)), "zero-volume domain maps to a finite y");
    requireNear(r.scales.volume(0), (r.scales.layout.volumeTop + r.scales.layout.volumeBottom) * 0.5,
                1e-9, "zero-width domain maps to the middle");

    std::printf("  Test 5 (degenerate) PASS\n");
  }

  // ---- Test 6: series overload and volume fraction ----
  {
    auto series = sl::BarSeries::create(twoBars(), {}).series;
    sl::ScalesResult a = sl::computeScales(*series, sl::ChartViewport{}, 0.4);
    requireTrue(a.ok, "series overload");
    requireNear(a.scales.layout.volumeTop, 480 - 460 * 0.4, 1e-9, "custom volume fraction");

    sl::ChartViewport wide;
    wide.width = 1200;
    sl::ScalesResult b = sl::computeScales(*series, wide);
    requireNear(b.scales.layout.plot.right, 1140, 1e-9, "width moves the right edge");
    requireTrue(b.scales.bandwidth() > a.scales.bandwidth(), "wider plot, wider bands");
    requireNear(b.scales.price.d0, a.scales.price.d0, 0, "domains independent of width");

    std::printf("  Test 6 (overloads) PASS\n");
  }

  std::printf("D2.1 scales: ALL PASS\n");
  return 0;
}
