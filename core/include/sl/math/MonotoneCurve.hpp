#pragma once
#include <cstddef>
#include <vector>

namespace sl {

struct CurvePoint {
  double x{0};
  double y{0};
};

// Monotone cubic interpolation along x (Steffen-limited Hermite tangents).
// The curve passes through every input point and never overshoots between
// two of them. Inputs must be sorted by strictly increasing x.
//
// Returns a polyline: the input points with `samplesPerSegment - 1`
// interpolated points inserted between each neighbouring pair.
//   0 points -> empty, 1 point -> that point, 2 points -> straight line.
std::vector<CurvePoint> sampleMonotoneX(const std::vector<CurvePoint>& pts,
                                        int samplesPerSegment = 8);

// Tangent (dy/dx) at each input point, exposed for tests.
std::vector<double> monotoneTangents(const std::vector<CurvePoint>& pts);

} // namespace sl
