#include "sl/gl/Renderer.hpp"
#include "sl/pipelines/PipelineCatalog.hpp"
#include "sl/text/GlyphAtlas.hpp"
#include "sl/text/TextLayout.hpp"
#include <algorithm>
#include <cstdio>
#include <vector>

namespace sl {

// ---- line2d@1: each segment is one instance expanded to a quad ----

static const char* kLineVert = R"GLSL(
#version 330 core
in vec4 a_seg;
uniform mat3 u_transform;
uniform vec2 u_halfWidth;
void main() {
    vec3 c0 = u_transform * vec3(a_seg.xy, 1.0);
    vec3 c1 = u_transform * vec3(a_seg.zw, 1.0);
    vec2 dir = c1.xy - c0.xy;
    float len = length(dir);
    vec2 d = (len > 0.000001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x) * u_halfWidth;

    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, -1.0);
    else if (v == 1) uv = vec2(1.0, -1.0);
    else if (v == 2) uv = vec2(0.0,  1.0);
    else if (v == 3) uv = vec2(0.0,  1.0);
    else if (v == 4) uv = vec2(1.0, -1.0);
    else             uv = vec2(1.0,  1.0);
    gl_Position = vec4(mix(c0.xy, c1.xy, uv.x) + perp * uv.y, 0.0, 1.0);
}
)GLSL";

static const char* kSolidFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_color;
void main() {
    outColor = u_color;
}
)GLSL";

// ---- instancedRect@1 ----

static const char* kRectVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
void main() {
    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, 0.0);
    else if (v == 1) uv = vec2(1.0, 0.0);
    else if (v == 2) uv = vec2(0.0, 1.0);
    else if (v == 3) uv = vec2(0.0, 1.0);
    else if (v == 4) uv = vec2(1.0, 0.0);
    else             uv = vec2(1.0, 1.0);
    float x = mix(a_rect.x, a_rect.z, uv.x);
    float y = mix(a_rect.y, a_rect.w, uv.y);
    vec3 p = u_transform * vec3(x, y, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

// ---- text@1: glyph quads sampled from the coverage atlas ----

static const char* kTextVert = R"GLSL(
#version 330 core
in vec4 a_g0;
in vec4 a_g1;
uniform mat3 u_transform;
out vec2 v_uv;
void main() {
    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, 0.0);
    else if (v == 1) uv = vec2(1.0, 0.0);
    else if (v == 2) uv = vec2(0.0, 1.0);
    else if (v == 3) uv = vec2(0.0, 1.0);
    else if (v == 4) uv = vec2(1.0, 0.0);
    else             uv = vec2(1.0, 1.0);
    float x = mix(a_g0.x, a_g0.z, uv.x);
    float y = mix(a_g0.y, a_g0.w, uv.y);
    v_uv = vec2(mix(a_g1.x, a_g1.z, uv.x), mix(a_g1.y, a_g1.w, uv.y));
    vec3 p = u_transform * vec3(x, y, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kTextFrag = R"GLSL(
#version 330 core
uniform sampler2D u_atlas;
uniform vec4 u_color;
in vec2 v_uv;
out vec4 outColor;
void main() {
    float a = texture(u_atlas, v_uv).r;
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

Renderer::~Renderer() {
  if (vao_) glDeleteVertexArrays(1, &vao_);
  if (textVbo_) glDeleteBuffers(1, &textVbo_);
  if (atlasTexture_) glDeleteTextures(1, &atlasTexture_);
}

bool Renderer::init() {
  if (!lineProg_.build("line2d", kLineVert, kSolidFrag)) return false;
  if (!rectProg_.build("instancedRect", kRectVert, kSolidFrag)) return false;
  if (!textProg_.build("text", kTextVert, kTextFrag)) return false;

  glGenVertexArrays(1, &vao_);
  glGenBuffers(1, &textVbo_);
  glGenTextures(1, &atlasTexture_);
  inited_ = true;
  return true;
}

void Renderer::uploadAtlasIfDirty() {
  if (!atlas_ || !atlas_->isDirty()) return;
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  const GLsizei sz = static_cast<GLsizei>(atlas_->atlasSize());
  glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, sz, sz, 0,
               GL_RED, GL_UNSIGNED_BYTE, atlas_->atlasData());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);
  atlas_->clearDirty();
}

void Renderer::drawLines(const DrawItem& di, const Geometry& geo, const float* xform,
                         RenderStats& stats) {
  const GLuint vbo = gpuBufs_.getGlBuffer(geo.vertexBufferId);
  if (!vbo || geo.vertexCount < 2) return;

  lineProg_.use();
  lineProg_.setMat3("u_transform", xform);
  lineProg_.setVec4("u_color", di.color);
  // Half the line width in clip units per axis; xform[0] = 2/W, xform[4] = -2/H.
  const float hw = di.lineWidth * 0.5f;
  lineProg_.setVec2("u_halfWidth", hw * xform[0], -hw * xform[4]);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLuint aSeg = static_cast<GLuint>(lineProg_.attrib("a_seg"));
  glEnableVertexAttribArray(aSeg);
  glVertexAttribPointer(aSeg, 4, GL_FLOAT, GL_FALSE, 16, nullptr);
  glVertexAttribDivisor(aSeg, 1);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount / 2));
  stats.drawCalls++;

  glVertexAttribDivisor(aSeg, 0);
  glDisableVertexAttribArray(aSeg);
}

void Renderer::drawRects(const DrawItem& di, const Geometry& geo, const float* xform,
                         RenderStats& stats) {
  const GLuint vbo = gpuBufs_.getGlBuffer(geo.vertexBufferId);
  if (!vbo || geo.vertexCount == 0) return;

  rectProg_.use();
  rectProg_.setMat3("u_transform", xform);
  rectProg_.setVec4("u_color", di.color);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLuint aRect = static_cast<GLuint>(rectProg_.attrib("a_rect"));
  glEnableVertexAttribArray(aRect);
  glVertexAttribPointer(aRect, 4, GL_FLOAT, GL_FALSE,
                        static_cast<GLsizei>(strideOf(VertexFormat::Rect4)), nullptr);
  glVertexAttribDivisor(aRect, 1);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  stats.drawCalls++;

  glVertexAttribDivisor(aRect, 0);
  glDisableVertexAttribArray(aRect);
}

void Renderer::drawText(const DrawItem& di, const Geometry& geo, const BufferStore& store,
                        const float* xform, RenderStats& stats) {
  if (!atlas_ || !atlas_->hasFont()) return;
  const std::vector<TextLabel>* labels = store.getLabels(geo.vertexBufferId);
  if (!labels || labels->empty() || geo.vertexCount == 0) return;

  std::vector<float> glyphs;
  std::uint32_t count = 0;
  const std::size_t n = std::min<std::size_t>(labels->size(), geo.vertexCount);
  for (std::size_t i = 0; i < n; i++) {
    TextLayoutResult r = layoutLabel(*atlas_, (*labels)[i], di.fontSize);
    glyphs.insert(glyphs.end(), r.glyphInstances.begin(), r.glyphInstances.end());
    count += static_cast<std::uint32_t>(r.glyphCount);
  }
  if (count == 0) return;

  textProg_.use();
  textProg_.setMat3("u_transform", xform);
  textProg_.setVec4("u_color", di.color);
  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  textProg_.setInt("u_atlas", 0);

  glBindBuffer(GL_ARRAY_BUFFER, textVbo_);
  glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(glyphs.size() * sizeof(float)),
               glyphs.data(), GL_STREAM_DRAW);

  const GLsizei stride = 8 * sizeof(float);
  const GLuint aG0 = static_cast<GLuint>(textProg_.attrib("a_g0"));
  const GLuint aG1 = static_cast<GLuint>(textProg_.attrib("a_g1"));
  glEnableVertexAttribArray(aG0);
  glVertexAttribPointer(aG0, 4, GL_FLOAT, GL_FALSE, stride, nullptr);
  glVertexAttribDivisor(aG0, 1);
  glEnableVertexAttribArray(aG1);
  glVertexAttribPointer(aG1, 4, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<const void*>(16));
  glVertexAttribDivisor(aG1, 1);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(count));
  stats.drawCalls++;
  stats.glyphs += count;

  glVertexAttribDivisor(aG0, 0);
  glVertexAttribDivisor(aG1, 0);
  glDisableVertexAttribArray(aG0);
  glDisableVertexAttribArray(aG1);
  glBindTexture(GL_TEXTURE_2D, 0);
}

RenderStats Renderer::render(const Canvas& canvas, int viewW, int viewH,
                             int framebufferW, int framebufferH,
                             const float clearColor[4]) {
  RenderStats stats{};
  if (!inited_ || viewW <= 0 || viewH <= 0 || framebufferW <= 0 || framebufferH <= 0) {
    return stats;
  }

  const Scene& scene = canvas.scene;
  stats.uploadedBytes = gpuBufs_.sync(scene, canvas.buffers);
  uploadAtlasIfDirty();

  // Canvas pixels -> clip space (column-major).
  const float xform[9] = {
    2.0f / static_cast<float>(viewW), 0.0f, 0.0f,
    0.0f, -2.0f / static_cast<float>(viewH), 0.0f,
    -1.0f, 1.0f, 1.0f
  };

  glViewport(0, 0, framebufferW, framebufferH);
  glClearColor(clearColor[0], clearColor[1], clearColor[2], clearColor[3]);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glBindVertexArray(vao_);

  // Pane -> layer -> draw item, each in ascending id order.
  for (Id paneId : scene.paneIds()) {
    for (Id layerId : scene.layerIds()) {
      const Layer* layer = scene.getLayer(layerId);
      if (!layer || layer->paneId != paneId) continue;

      for (Id diId : scene.drawItemIds()) {
        const DrawItem* di = scene.getDrawItem(diId);
        if (!di || di->layerId != layerId || di->pipeline.empty()) continue;
        const Geometry* geo = scene.getGeometry(di->geometryId);
        if (!geo) continue;

        const PipelineSpec* pipe = findPipeline(di->pipeline);
        if (!pipe) continue;

        switch (pipe->kind) {
          case PipelineKind::Line2d:
            drawLines(*di, *geo, xform, stats);
            break;
          case PipelineKind::InstancedRect:
            drawRects(*di, *geo, xform, stats);
            break;
          case PipelineKind::Text:
            drawText(*di, *geo, canvas.buffers, xform, stats);
            break;
        }
      }
    }
  }

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  glDisable(GL_BLEND);
  glFlush();
  return stats;
}

} // namespace sl
