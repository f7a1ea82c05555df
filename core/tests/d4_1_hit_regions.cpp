// D4.1 - Hit regions
// Tests: regions tile the plot with no gaps or overlaps, half-open
// intervals, two-bar halves, single bar covers the plot, points outside
// the plot miss, rebuild after resize.

#include "sl/interaction/HitRegions.hpp"
#include "sl/layout/Scales.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

static std::vector<sl::Bar> makeBars(std::size_t n) {
  std::vector<sl::Bar> bars;
  for (std::size_t i = 0; i < n; i++) {
    sl::Bar b;
    char day[16];
    std::snprintf(day, sizeof(day), "2024-05-%02d", static_cast<int>(i + 1));
    b.time = day;
    b.open = 10;
    b.high = 12;
    b.low = 9;
    b.close = 11;
    b.volume = 100;
    bars.push_back(b);
  }
  return bars;
}

int main() {
  // ---- Test 1: two bars split the plot in half ----
  {
    sl::Scales s = sl::computeScales(makeBars(2), sl::ChartViewport{}).scales;
    sl::HitRegions hr(s);
    requireTrue(hr.size() == 2, "two regions");
    requireNear(hr[0].x0, 60, 1e-9, "region 0 starts at plot left");
    requireNear(hr[0].x1, 400, 1e-9, "regions meet at the plot center");
    requireNear(hr[1].x1, 740, 1e-9, "region 1 ends at plot right");
    requireNear(hr[1].centerX, s.time.center(1), 1e-9, "center recorded");

    requireTrue(hr.regionAt(100, 200) == std::optional<std::size_t>(0), "left half -> 0");
    requireTrue(hr.regionAt(399.999, 200) == std::optional<std::size_t>(0), "just left of edge -> 0");
    requireTrue(hr.regionAt(hr[0].x1, 200) == std::optional<std::size_t>(1), "edge belongs to the right");
    requireTrue(hr.regionAt(740, 200) == std::optional<std::size_t>(1), "last region closed");
    requireTrue(hr.regionAt(60, 200) == std::optional<std::size_t>(0), "plot left edge -> 0");

    // The volume pane and the gap between panes also hit.
    requireTrue(hr.regionAt(600, s.layout.volumeTop + 5) == std::optional<std::size_t>(1),
                "volume pane hits");
    requireTrue(hr.regionAt(600, s.layout.priceBottom + 5) == std::optional<std::size_t>(1),
                "pane gap hits");

    std::printf("  Test 1 (halves) PASS\n");
  }

  // ---- Test 2: outside the plot ----
  {
    sl::Scales s = sl::computeScales(makeBars(2), sl::ChartViewport{}).scales;
    sl::HitRegions hr(s);
    requireTrue(!hr.regionAt(59.9, 200).has_value(), "left margin");
    requireTrue(!hr.regionAt(740.1, 200).has_value(), "right margin");
    requireTrue(!hr.regionAt(300, 10).has_value(), "top margin");
    requireTrue(!hr.regionAt(300, 490).has_value(), "bottom margin");

    sl::HitRegions empty;
    requireTrue(!empty.regionAt(300, 200).has_value(), "no regions -> miss");

    std::printf("  Test 2 (outside) PASS\n");
  }

  // ---- Test 3: single bar ----
  {
    sl::Scales s = sl::computeScales(makeBars(1), sl::ChartViewport{}).scales;
    sl::HitRegions hr(s);
    requireTrue(hr.size() == 1, "one region");
    requireNear(hr[0].x0, 60, 1e-9, "covers from plot left");
    requireNear(hr[0].x1, 740, 1e-9, "covers to plot right");
    requireTrue(hr.regionAt(61, 21) == std::optional<std::size_t>(0), "anywhere hits");
    requireTrue(hr.regionAt(739, 479) == std::optional<std::size_t>(0), "far corner hits");

    std::printf("  Test 3 (single bar) PASS\n");
  }

  // ---- Test 4: tiling for many bars ----
  {
    sl::Scales s = sl::computeScales(makeBars(31), sl::ChartViewport{}).scales;
    sl::HitRegions hr(s);
    requireTrue(hr.size() == 31, "one region per bar");
    requireTrue(hr.boundaries().size() == 32, "n + 1 edges");
    for (std::size_t i = 0; i < hr.size(); i++) {
      requireTrue(hr[i].index == i, "index");
      requireTrue(hr[i].x0 < hr[i].x1, "non-empty");
      requireTrue(hr[i].x0 <= hr[i].centerX && hr[i].centerX < hr[i].x1, "center inside");
      if (i > 0) requireTrue(hr[i].x0 == hr[i - 1].x1, "no gaps or overlaps");
      requireTrue(hr.regionAt(hr[i].centerX, 100) == std::optional<std::size_t>(i),
                  "center resolves to its own bar");
    }
    // Interior regions are one step wide: wider than the visible body.
    requireNear(hr[10].x1 - hr[10].x0, s.time.step, 1e-9, "interior width is one step");
    requireNear(s.time.step, s.bandwidth() / (1.0 - sl::kBandPadding), 1e-9, "step = bandwidth / 0.7");

    std::printf("  Test 4 (tiling) PASS\n");
  }

  // ---- Test 5: rebuild ----
  {
    sl::Scales a = sl::computeScales(makeBars(2), sl::ChartViewport{}).scales;
    sl::ChartViewport wide;
    wide.width = 1000;
    sl::Scales b = sl::computeScales(makeBars(2), wide).scales;

    sl::HitRegions hr(a);
    hr.build(b);
    requireNear(hr[0].x1, 500, 1e-9, "edge moves with the plot");
    requireTrue(hr.regionAt(900, 200) == std::optional<std::size_t>(1), "new area hits");

    hr.clear();
    requireTrue(hr.empty() && hr.boundaries().empty(), "cleared");

    std::printf("  Test 5 (rebuild) PASS\n");
  }

  std::printf("D4.1 hit_regions: ALL PASS\n");
  return 0;
}
