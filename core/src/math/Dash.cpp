#include "sl/math/Dash.hpp"
#include <algorithm>
#include <cmath>

namespace sl {

void appendDashedLine(std::vector<float>& out,
                      float x0, float y0, float x1, float y1,
                      float on, float off) {
  const float dx = x1 - x0;
  const float dy = y1 - y0;
  const float len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0.0f) return;

  if (on <= 0.0f || off <= 0.0f) {
    out.insert(out.end(), {x0, y0, x1, y1});
    return;
  }

  const float ux = dx / len;
  const float uy = dy / len;
  for (float d = 0.0f; d < len; d += on + off) {
    const float e = std::min(d + on, len);
    out.push_back(x0 + ux * d);
    out.push_back(y0 + uy * d);
    out.push_back(x0 + ux * e);
    out.push_back(y0 + uy * e);
  }
}

} // namespace sl
