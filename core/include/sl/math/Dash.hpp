#pragma once
#include <vector>

namespace sl {

// Append dashed segments of the line (x0,y0)->(x1,y1) to `out` as pos2
// vertex pairs. The pattern starts with an "on" run of `on` pixels
// followed by `off` pixels; the last dash is clipped at the end point.
// Non-positive `on` or `off` draws a solid line.
void appendDashedLine(std::vector<float>& out,
                      float x0, float y0, float x1, float y1,
                      float on, float off);

} // namespace sl
