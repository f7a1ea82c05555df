#include "sl/text/GlyphAtlas.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <utility>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace sl {

// Empty texels around each glyph so linear sampling never bleeds.
static constexpr std::uint32_t kPad = 1;

GlyphAtlas::GlyphAtlas() {
  reset();
}

GlyphAtlas::~GlyphAtlas() = default;

void GlyphAtlas::reset() {
  atlas_.assign(static_cast<std::size_t>(atlasSize_) * atlasSize_, 0);
  glyphs_.fill(GlyphInfo{});
  rasterized_ = false;
  dirty_ = true;
}

void GlyphAtlas::setAtlasSize(std::uint32_t size) {
  atlasSize_ = size;
  reset();
}

void GlyphAtlas::setGlyphPx(std::uint32_t px) {
  glyphPx_ = px;
  reset();
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas: cannot open %s\n", path.c_str());
    return false;
  }
  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(f)),
                                   std::istreambuf_iterator<char>());

  auto font = std::make_unique<stbtt_fontinfo>();
  const int offset = bytes.empty() ? -1 : stbtt_GetFontOffsetForIndex(bytes.data(), 0);
  if (offset < 0 || !stbtt_InitFont(font.get(), bytes.data(), offset)) {
    std::fprintf(stderr, "GlyphAtlas: %s is not a usable TrueType font\n", path.c_str());
    return false;
  }

  // The font info points into the byte buffer; a vector move keeps it.
  fontData_ = std::move(bytes);
  font_ = std::move(font);
  reset();
  return true;
}

bool GlyphAtlas::ensureAscii() {
  if (!font_ || rasterized_) return false;

  const float scale = stbtt_ScaleForPixelHeight(font_.get(), static_cast<float>(glyphPx_));
  const float invAtlas = 1.0f / static_cast<float>(atlasSize_);

  std::uint32_t penX = kPad;
  std::uint32_t penY = kPad;
  std::uint32_t rowH = 0;

  for (std::uint32_t i = 0; i < kGlyphCount; i++) {
    const int glyphIdx = stbtt_FindGlyphIndex(font_.get(), static_cast<int>(kFirstChar + i));

    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(font_.get(), glyphIdx, &advW, &lsb);
    int ix0 = 0, iy0 = 0, ix1 = 0, iy1 = 0;
    stbtt_GetGlyphBitmapBox(font_.get(), glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    GlyphInfo& g = glyphs_[i];
    g.advance = static_cast<float>(advW) * scale;
    g.bearingX = static_cast<float>(ix0);
    g.bearingY = static_cast<float>(-iy0);

    const int gw = ix1 - ix0;
    const int gh = iy1 - iy0;
    if (gw <= 0 || gh <= 0) continue;

    const std::uint32_t cellW = static_cast<std::uint32_t>(gw) + 2 * kPad;
    const std::uint32_t cellH = static_cast<std::uint32_t>(gh) + 2 * kPad;
    if (penX + cellW > atlasSize_) {
      penX = kPad;
      penY += rowH;
      rowH = 0;
    }
    if (penX + cellW > atlasSize_ || penY + cellH > atlasSize_) {
      std::fprintf(stderr, "GlyphAtlas: %upx glyphs do not fit a %ux%u atlas\n",
                   glyphPx_, atlasSize_, atlasSize_);
      reset();
      return false;
    }

    // Rasterize straight into the atlas; stride is the atlas width.
    const std::uint32_t x = penX + kPad;
    const std::uint32_t y = penY + kPad;
    stbtt_MakeGlyphBitmap(font_.get(), &atlas_[static_cast<std::size_t>(y) * atlasSize_ + x],
                          gw, gh, static_cast<int>(atlasSize_), scale, scale, glyphIdx);

    g.u0 = static_cast<float>(x) * invAtlas;
    g.v0 = static_cast<float>(y) * invAtlas;
    g.u1 = static_cast<float>(x + static_cast<std::uint32_t>(gw)) * invAtlas;
    g.v1 = static_cast<float>(y + static_cast<std::uint32_t>(gh)) * invAtlas;
    g.w = static_cast<float>(gw);
    g.h = static_cast<float>(gh);

    penX += cellW;
    rowH = std::max(rowH, cellH);
  }

  rasterized_ = true;
  dirty_ = true;
  return true;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  if (!rasterized_ || codepoint < kFirstChar || codepoint - kFirstChar >= kGlyphCount) {
    return nullptr;
  }
  return &glyphs_[codepoint - kFirstChar];
}

} // namespace sl
