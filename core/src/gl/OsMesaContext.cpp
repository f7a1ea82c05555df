#include "sl/gl/OsMesaContext.hpp"
#include <cstddef>
#include <cstdio>

namespace sl {

OsMesaContext::~OsMesaContext() {
  if (ctx_) OSMesaDestroyContext(ctx_);
}

bool OsMesaContext::init(int width, int height) {
  if (ctx_) {
    std::fprintf(stderr, "OsMesaContext: init called twice\n");
    return false;
  }
  if (width <= 0 || height <= 0) {
    std::fprintf(stderr, "OsMesaContext: invalid size %dx%d\n", width, height);
    return false;
  }

  // No depth or stencil: chart layers are ordered by draw sequence.
  static const int attribs[] = {
    OSMESA_FORMAT, OSMESA_RGBA,
    OSMESA_DEPTH_BITS, 0,
    OSMESA_STENCIL_BITS, 0,
    OSMESA_PROFILE, OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaContext: no 3.3 core context available\n");
    return false;
  }

  if (!bindFramebuffer(width, height) ||
      !gladLoadGL((GLADloadfunc)OSMesaGetProcAddress)) {
    std::fprintf(stderr, "OsMesaContext: context setup failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    width_ = height_ = 0;
    framebuf_.clear();
    return false;
  }
  return true;
}

bool OsMesaContext::resize(int width, int height) {
  if (!ctx_ || width <= 0 || height <= 0) return false;
  if (width == width_ && height == height_) return true;
  return bindFramebuffer(width, height);
}

bool OsMesaContext::bindFramebuffer(int width, int height) {
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(width) * height * 4, 0);
  if (!OSMesaMakeCurrent(ctx_, buf.data(), GL_UNSIGNED_BYTE, width, height)) {
    std::fprintf(stderr, "OsMesaContext: cannot bind %dx%d framebuffer\n", width, height);
    // The previous buffer stays bound.
    return false;
  }
  framebuf_.swap(buf);
  width_ = width;
  height_ = height;
  return true;
}

void OsMesaContext::swapBuffers() {
  glFinish();
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  flipRows(pixels, width_, height_);
  return pixels;
}

} // namespace sl
