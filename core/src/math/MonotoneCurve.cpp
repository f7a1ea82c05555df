#include "sl/math/MonotoneCurve.hpp"
#include <algorithm>
#include <cmath>

namespace sl {

static double signOf(double v) { return v < 0 ? -1.0 : 1.0; }

// Interior tangent at p1 from its neighbours.
static double interiorSlope(const CurvePoint& p0, const CurvePoint& p1, const CurvePoint& p2) {
  double h0 = p1.x - p0.x;
  double h1 = p2.x - p1.x;
  double s0 = h0 != 0.0 ? (p1.y - p0.y) / h0 : 0.0;
  double s1 = h1 != 0.0 ? (p2.y - p1.y) / h1 : 0.0;
  double p = (h0 + h1) != 0.0 ? (s0 * h1 + s1 * h0) / (h0 + h1) : 0.0;
  double t = (signOf(s0) + signOf(s1)) *
             std::min({std::fabs(s0), std::fabs(s1), 0.5 * std::fabs(p)});
  return std::isfinite(t) ? t : 0.0;
}

// End tangent from the one-sided secant and the neighbouring tangent.
static double endSlope(const CurvePoint& a, const CurvePoint& b, double t) {
  double h = b.x - a.x;
  return h != 0.0 ? (3.0 * (b.y - a.y) / h - t) / 2.0 : t;
}

std::vector<double> monotoneTangents(const std::vector<CurvePoint>& pts) {
  const std::size_t n = pts.size();
  std::vector<double> t(n, 0.0);
  if (n < 3) {
    if (n == 2 && pts[1].x != pts[0].x) {
      double s = (pts[1].y - pts[0].y) / (pts[1].x - pts[0].x);
      t[0] = t[1] = s;
    }
    return t;
  }
  for (std::size_t i = 1; i + 1 < n; i++) {
    t[i] = interiorSlope(pts[i - 1], pts[i], pts[i + 1]);
  }
  t[0] = endSlope(pts[0], pts[1], t[1]);
  t[n - 1] = endSlope(pts[n - 2], pts[n - 1], t[n - 2]);
  return t;
}

std::vector<CurvePoint> sampleMonotoneX(const std::vector<CurvePoint>& pts,
                                        int samplesPerSegment) {
  std::vector<CurvePoint> out;
  const std::size_t n = pts.size();
  if (n == 0) return out;
  if (n <= 2 || samplesPerSegment < 2) return pts;

  const std::vector<double> t = monotoneTangents(pts);
  out.reserve((n - 1) * static_cast<std::size_t>(samplesPerSegment) + 1);
  out.push_back(pts[0]);

  for (std::size_t i = 0; i + 1 < n; i++) {
    const CurvePoint& a = pts[i];
    const CurvePoint& b = pts[i + 1];
    double dx = (b.x - a.x) / 3.0;
    // Cubic Bezier control points
    CurvePoint c1{a.x + dx, a.y + dx * t[i]};
    CurvePoint c2{b.x - dx, b.y - dx * t[i + 1]};

    for (int s = 1; s <= samplesPerSegment; s++) {
      if (s == samplesPerSegment) {
        out.push_back(b);
        break;
      }
      double u = static_cast<double>(s) / samplesPerSegment;
      double v = 1.0 - u;
      double w0 = v * v * v;
      double w1 = 3.0 * v * v * u;
      double w2 = 3.0 * v * u * u;
      double w3 = u * u * u;
      out.push_back({w0 * a.x + w1 * c1.x + w2 * c2.x + w3 * b.x,
                     w0 * a.y + w1 * c1.y + w2 * c2.y + w3 * b.y});
    }
  }
  return out;
}

} // namespace sl
