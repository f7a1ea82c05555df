#pragma once
#include "sl/gl/GlContext.hpp"
#include "sl/gl/Renderer.hpp"
#include "sl/render/FramePresenter.hpp"
#include "sl/text/GlyphAtlas.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sl {

// Presents committed canvases through a GL context.
class GlPresenter : public FramePresenter {
public:
  explicit GlPresenter(GlContext& ctx);

  // Builds shaders. The context must be current. An empty or unreadable
  // font path leaves text undrawn.
  bool init(const std::string& fontPath = {});

  bool present(const Canvas& canvas, const ChartViewport& viewport,
               const Theme& theme) override;

  std::uint64_t presentedFrames() const { return frames_; }
  const RenderStats& lastStats() const { return lastStats_; }
  bool hasText() const { return atlas_.getGlyph('0') != nullptr; }

private:
  GlContext& ctx_;
  Renderer renderer_;
  GlyphAtlas atlas_;
  bool inited_{false};
  std::uint64_t frames_{0};
  RenderStats lastStats_{};
};

// Writes top-row-first RGBA readback as a binary PPM.
bool writePpm(const std::string& path, const std::vector<std::uint8_t>& rgba,
              int width, int height);

} // namespace sl
