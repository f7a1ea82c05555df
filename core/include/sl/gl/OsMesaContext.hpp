#pragma once
#include "sl/gl/GlContext.hpp"
#include <glad/gl.h>    // must precede osmesa.h, which would pull in GL/gl.h

// osmesa.h expects GLAPI and APIENTRY from GL/gl.h; glad suppresses that header.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>
#include <vector>

namespace sl {

// Offscreen 3.3 core context over a CPU framebuffer. Used for chart
// snapshots and pixel tests.
class OsMesaContext : public GlContext {
public:
  OsMesaContext() = default;
  ~OsMesaContext() override;

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  // Rebinds the context to a framebuffer of the new size. Contents are
  // cleared; the next presented frame repaints them.
  bool resize(int width, int height);

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

private:
  bool bindFramebuffer(int width, int height);

  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> framebuf_;
};

} // namespace sl
