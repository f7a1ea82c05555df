#pragma once
#include "sl/buffers/BufferStore.hpp"
#include "sl/text/GlyphAtlas.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sl {

struct TextLayoutResult {
  std::vector<float> glyphInstances;  // x0,y0,x1,y1,u0,v0,u1,v1 (y down)
  int glyphCount{0};
  float advanceWidth{0};
};

inline float measureText(const GlyphAtlas& atlas, const std::string& text, float fontSize) {
  const float scale = fontSize / static_cast<float>(atlas.glyphPx());
  float width = 0;
  for (char c : text) {
    const GlyphInfo* g = atlas.getGlyph(static_cast<unsigned char>(c));
    if (g) width += g->advance * scale;
  }
  return width;
}

// Glyph quads for one label. The label's y is the vertical middle of the
// text; the baseline sits 0.35 em below it.
inline TextLayoutResult layoutLabel(const GlyphAtlas& atlas, const TextLabel& label,
                                    float fontSize) {
  TextLayoutResult r;
  const float scale = fontSize / static_cast<float>(atlas.glyphPx());

  float startX = label.x;
  if (label.anchor != TextAnchor::Start) {
    const float width = measureText(atlas, label.text, fontSize);
    startX -= (label.anchor == TextAnchor::Middle) ? width * 0.5f : width;
  }
  const float baselineY = label.y + fontSize * 0.35f;

  float cursorX = startX;
  for (char c : label.text) {
    const GlyphInfo* g = atlas.getGlyph(static_cast<unsigned char>(c));
    if (!g) continue;
    if (g->w > 0 && g->h > 0) {
      const float x0 = cursorX + g->bearingX * scale;
      const float y0 = baselineY - g->bearingY * scale;
      r.glyphInstances.insert(r.glyphInstances.end(),
                              {x0, y0, x0 + g->w * scale, y0 + g->h * scale,
                               g->u0, g->v0, g->u1, g->v1});
      r.glyphCount++;
    }
    cursorX += g->advance * scale;
  }
  r.advanceWidth = cursorX - startX;
  return r;
}

} // namespace sl
