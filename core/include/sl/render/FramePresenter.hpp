#pragma once
#include "sl/layout/ChartViewport.hpp"
#include "sl/style/Theme.hpp"

namespace sl {

struct Canvas;

// Puts a committed canvas on screen (or into an offscreen target).
class FramePresenter {
public:
  virtual ~FramePresenter() = default;
  virtual bool present(const Canvas& canvas, const ChartViewport& viewport,
                       const Theme& theme) = 0;
};

} // namespace sl
