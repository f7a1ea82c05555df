#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace sl {

// Surface a GlPresenter draws chart frames into. Sizes are framebuffer
// pixels, which can exceed the chart viewport on HiDPI windows.
class GlContext {
public:
  virtual ~GlContext() = default;

  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // RGBA, top row first so that row y matches canvas y.
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

// glReadPixels returns the bottom row first; reorders into canvas rows.
inline void flipRows(std::vector<std::uint8_t>& rgba, int width, int height) {
  const std::size_t stride = static_cast<std::size_t>(width) * 4;
  std::vector<std::uint8_t> row(stride);
  for (int top = 0, bottom = height - 1; top < bottom; top++, bottom--) {
    std::uint8_t* a = rgba.data() + static_cast<std::size_t>(top) * stride;
    std::uint8_t* b = rgba.data() + static_cast<std::size_t>(bottom) * stride;
    std::memcpy(row.data(), a, stride);
    std::memcpy(a, b, stride);
    std::memcpy(b, row.data(), stride);
  }
}

} // namespace sl
