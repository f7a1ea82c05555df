#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct stbtt_fontinfo;

namespace sl {

struct GlyphInfo {
  // UV in atlas [0..1]; v0 is the glyph's top row.
  float u0{0}, v0{0}, u1{0}, v1{0};
  // Pixels at the rasterized size.
  float advance{0};
  float bearingX{0};
  float bearingY{0};  // baseline to glyph top
  float w{0}, h{0};   // zero for whitespace
};

// R8 coverage atlas holding the printable ASCII range, which covers every
// chart label (prices, volumes, dates, status messages). Glyphs are
// rasterized with stb_truetype in one pass and packed row by row; row 0 of
// atlasData() is the top of the texture.
class GlyphAtlas {
public:
  static constexpr std::uint32_t kFirstChar = 32;
  static constexpr std::uint32_t kGlyphCount = 95;  // ' ' .. '~'

  GlyphAtlas();
  ~GlyphAtlas();

  GlyphAtlas(const GlyphAtlas&) = delete;
  GlyphAtlas& operator=(const GlyphAtlas&) = delete;

  // Replaces the current font and discards rasterized glyphs.
  bool loadFontFile(const std::string& path);
  bool hasFont() const { return font_ != nullptr; }

  // Rasterizes the ASCII range. Returns true if the atlas changed; false
  // when it was already built, no font is loaded, or the glyphs do not fit.
  bool ensureAscii();

  // nullptr outside the ASCII range or before ensureAscii().
  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  bool isDirty() const { return dirty_; }
  void clearDirty() { dirty_ = false; }

  // Both discard rasterized glyphs; call ensureAscii() again afterwards.
  void setGlyphPx(std::uint32_t px);
  std::uint32_t glyphPx() const { return glyphPx_; }
  void setAtlasSize(std::uint32_t size);

private:
  void reset();

  std::uint32_t atlasSize_{512};
  std::uint32_t glyphPx_{24};

  std::vector<std::uint8_t> atlas_;
  std::vector<unsigned char> fontData_;
  std::unique_ptr<stbtt_fontinfo> font_;
  std::array<GlyphInfo, kGlyphCount> glyphs_{};
  bool rasterized_{false};
  bool dirty_{false};
};

} // namespace sl
