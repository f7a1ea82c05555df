#pragma once
#include "sl/gl/GpuBufferManager.hpp"
#include "sl/gl/ShaderProgram.hpp"
#include "sl/render/Canvas.hpp"
#include <glad/gl.h>
#include <cstdint>

namespace sl {

class GlyphAtlas;

struct RenderStats {
  std::uint32_t drawCalls{0};
  std::uint32_t glyphs{0};
  std::uint64_t uploadedBytes{0};
};

// Draws a canvas with GL. Vertex data is in canvas pixels (origin top-left,
// y down) and mapped to clip space by a single mat3.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Compile shaders, create VAO. Call once after the context is current.
  bool init();

  // Without an atlas, text@1 items are skipped.
  void setGlyphAtlas(GlyphAtlas* atlas) { atlas_ = atlas; }

  // Canvas coordinates span viewW x viewH; the GL viewport covers the
  // framebuffer, which may be larger on HiDPI displays.
  RenderStats render(const Canvas& canvas, int viewW, int viewH,
                     int framebufferW, int framebufferH, const float clearColor[4]);

private:
  void drawLines(const DrawItem& di, const Geometry& geo, const float* xform, RenderStats& stats);
  void drawRects(const DrawItem& di, const Geometry& geo, const float* xform, RenderStats& stats);
  void drawText(const DrawItem& di, const Geometry& geo, const BufferStore& store,
                const float* xform, RenderStats& stats);
  void uploadAtlasIfDirty();

  ShaderProgram lineProg_;   // line2d@1
  ShaderProgram rectProg_;   // instancedRect@1
  ShaderProgram textProg_;   // text@1
  GLuint vao_{0};
  GLuint textVbo_{0};
  GLuint atlasTexture_{0};
  bool inited_{false};

  GpuBufferManager gpuBufs_;
  GlyphAtlas* atlas_{nullptr};
};

} // namespace sl
