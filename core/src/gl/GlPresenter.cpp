#include "sl/gl/GlPresenter.hpp"
#include <cstdio>

namespace sl {

GlPresenter::GlPresenter(GlContext& ctx) : ctx_(ctx) {}

bool GlPresenter::init(const std::string& fontPath) {
  if (!renderer_.init()) {
    std::fprintf(stderr, "GlPresenter: renderer init failed\n");
    return false;
  }
  if (!fontPath.empty()) {
    if (atlas_.loadFontFile(fontPath) && atlas_.ensureAscii()) {
      renderer_.setGlyphAtlas(&atlas_);
    } else {
      std::fprintf(stderr, "GlPresenter: font '%s' not loaded, labels disabled\n",
                   fontPath.c_str());
    }
  }
  inited_ = true;
  return true;
}

bool GlPresenter::present(const Canvas& canvas, const ChartViewport& viewport,
                          const Theme& theme) {
  if (!inited_) return false;

  const int vw = static_cast<int>(viewport.width);
  const int vh = static_cast<int>(viewport.height);
  const int fw = ctx_.width() > 0 ? ctx_.width() : vw;
  const int fh = ctx_.height() > 0 ? ctx_.height() : vh;

  lastStats_ = renderer_.render(canvas, vw, vh, fw, fh, theme.backgroundColor);
  ctx_.swapBuffers();
  frames_++;
  return true;
}

bool writePpm(const std::string& path, const std::vector<std::uint8_t>& rgba,
              int width, int height) {
  if (width <= 0 || height <= 0 ||
      rgba.size() < static_cast<std::size_t>(width) * height * 4) {
    std::fprintf(stderr, "writePpm: pixel buffer does not match %dx%d\n", width, height);
    return false;
  }
  std::FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePpm: cannot open %s\n", path.c_str());
    return false;
  }
  std::fprintf(f, "P6\n%d %d\n255\n", width, height);
  for (int y = 0; y < height; y++) {
    for (int x = 0; x < width; x++) {
      const std::uint8_t* p = &rgba[(static_cast<std::size_t>(y) * width + x) * 4];
      std::fputc(p[0], f);
      std::fputc(p[1], f);
      std::fputc(p[2], f);
    }
  }
  const bool ok = std::fclose(f) == 0;
  if (!ok) std::fprintf(stderr, "writePpm: write to %s failed\n", path.c_str());
  return ok;
}

} // namespace sl
