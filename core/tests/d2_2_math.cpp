// D2.2 - Math helpers
// Tests: nice ticks, monotone curve sampling, dashed lines, value formatting.

#include "sl/math/Dash.hpp"
#include "sl/math/MonotoneCurve.hpp"
#include "sl/math/NiceTicks.hpp"
#include "sl/math/ValueFormat.hpp"

#include <algorithm>
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

int main() {
  // ---- Test 1: nice ticks ----
  {
    sl::TickSet t = sl::computeNiceTicks(0, 100, 5);
    requireTrue(t.values.size() == 6, "0..100 by 20");
    requireNear(t.step, 20, 1e-12, "step 20");

    t = sl::computeNiceTicks(0.1, 0.9, 4);
    requireNear(t.step, 0.2, 1e-12, "sub-unit step");
    requireNear(t.values.front(), 0.2, 1e-12, "first sub-unit tick");
    requireNear(t.values[1], 0.4, 0, "sub-unit ticks built without drift");

    t = sl::computeNiceTicks(5, 5, 6);
    requireTrue(t.values.size() == 1 && t.values[0] == 5, "zero span -> single tick");

    t = sl::computeNiceTicks(10, 0, 5);
    requireTrue(!t.values.empty() && t.values.front() == 0, "reversed bounds swapped");

    t = sl::computeNiceTicks(NAN, 1, 5);
    requireTrue(t.values.empty(), "non-finite -> no ticks");

    std::printf("  Test 1 (nice ticks) PASS\n");
  }

  // ---- Test 2: monotone curve ----
  {
    requireTrue(sl::sampleMonotoneX({}, 8).empty(), "no points -> empty");
    auto one = sl::sampleMonotoneX({{1, 2}}, 8);
    requireTrue(one.size() == 1 && one[0].x == 1 && one[0].y == 2, "single point kept");
    auto two = sl::sampleMonotoneX({{0, 0}, {10, 5}}, 8);
    requireTrue(two.size() == 2, "two points -> straight segment");

    std::vector<sl::CurvePoint> pts = {{0, 0}, {10, 1}, {20, 9}, {30, 10}, {40, 10}};
    auto line = sl::sampleMonotoneX(pts, 8);
    requireTrue(line.size() == 4 * 8 + 1, "samples per segment");
    requireTrue(line.front().x == 0 && line.back().x == 40, "endpoints kept");
    for (std::size_t i = 0; i < pts.size(); i++) {
      requireNear(line[i * 8].x, pts[i].x, 1e-12, "passes through input x");
      requireNear(line[i * 8].y, pts[i].y, 1e-12, "passes through input y");
    }
    for (std::size_t i = 1; i < line.size(); i++) {
      requireTrue(line[i].x > line[i - 1].x, "x strictly increasing");
      requireTrue(line[i].y >= line[i - 1].y - 1e-9, "monotone data stays monotone");
    }
    // Flat tail must not overshoot above 10.
    for (std::size_t i = 24; i < line.size(); i++) {
      requireTrue(line[i].y <= 10 + 1e-9, "no overshoot on flat segment");
    }

    auto t = sl::monotoneTangents(pts);
    requireNear(t[3], 0, 1e-12, "tangent zero next to a flat segment");

    std::printf("  Test 2 (monotone curve) PASS\n");
  }

  // ---- Test 3: dashed lines ----
  {
    std::vector<float> out;
    sl::appendDashedLine(out, 0, 5, 10, 5, 3, 3);
    requireTrue(out.size() == 8, "two dashes");
    requireNear(out[2], 3, 1e-6, "first dash ends at 3");
    requireNear(out[4], 6, 1e-6, "second dash starts at 6");

    out.clear();
    sl::appendDashedLine(out, 0, 0, 10, 0, 2, 2);
    requireTrue(out.size() == 12, "three dashes");
    requireNear(out[10], 10, 1e-6, "last dash clipped at end");

    out.clear();
    sl::appendDashedLine(out, 0, 0, 0, 10, 0, 0);
    requireTrue(out.size() == 4, "non-positive pattern draws solid");

    out.clear();
    sl::appendDashedLine(out, 1, 1, 1, 1, 3, 3);
    requireTrue(out.empty(), "zero-length line draws nothing");

    std::printf("  Test 3 (dashes) PASS\n");
  }

  // ---- Test 4: value formatting ----
  {
    requireTrue(sl::formatPriceTick(105) == "$105", "integer price tick");
    requireTrue(sl::formatPriceTick(102.5) == "$102.5", "fractional price tick");
    requireTrue(sl::formatVolumeTick(1.2e9) == "1.2B", "billions");
    requireTrue(sl::formatVolumeTick(3.4e6) == "3.4M", "millions");
    requireTrue(sl::formatVolumeTick(560e3) == "560K", "thousands");

    requireTrue(sl::formatPrice(104) == "$104.00", "price");
    requireTrue(sl::formatVolume(1500) == "1.50K", "volume K");
    requireTrue(sl::formatVolume(2.35e6) == "2.35M", "volume M");
    requireTrue(sl::formatVolume(999) == "999", "small volume");
    requireTrue(sl::formatPercent(1.234) == "+1.23%", "positive percent");
    requireTrue(sl::formatPercent(-0.45) == "-0.45%", "negative percent");
    requireTrue(sl::formatPercent(std::nullopt) == "-", "missing percent");
    requireTrue(sl::formatOptionalPrice(std::nullopt) == "-", "missing price");
    requireTrue(sl::formatOptionalVolume(1.2e6) == "1.20M", "optional volume");

    std::printf("  Test 4 (formatting) PASS\n");
  }

  std::printf("D2.2 math: ALL PASS\n");
  return 0;
}
