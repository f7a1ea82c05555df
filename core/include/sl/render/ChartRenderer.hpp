#pragma once
#include "sl/data/BarSeries.hpp"
#include "sl/ids/Id.hpp"
#include "sl/layout/Scales.hpp"
#include "sl/recipe/CrosshairRecipe.hpp"
#include "sl/recipe/Recipe.hpp"
#include "sl/render/Canvas.hpp"
#include "sl/render/FramePresenter.hpp"
#include "sl/style/Theme.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sl {

struct ChartRendererConfig {
  Theme theme{darkTheme()};
  bool drawVolumeMa{true};
  int gridTickCount{6};
  int priceTickCount{6};
  int volumeTickCount{3};
};

// The only writer of the drawing surface. Every render() is a full
// clear-and-redraw of all layers inside one command frame; the crosshair is
// the single piece of state updated in place.
class ChartRenderer {
public:
  explicit ChartRenderer(const ChartRendererConfig& config = {});
  ~ChartRenderer();

  ChartRenderer(const ChartRenderer&) = delete;
  ChartRenderer& operator=(const ChartRenderer&) = delete;

  // Creates the canvas. Returns false if already acquired.
  bool acquire();
  // Drops the canvas and everything drawn on it.
  void release();
  bool isAcquired() const { return canvas_ != nullptr; }

  void setPresenter(FramePresenter* presenter) { presenter_ = presenter; }
  void setTheme(const Theme& theme) { config_.theme = theme; }
  const ChartRendererConfig& config() const { return config_; }

  // Grid, axes, candles, volume, MA overlays and a hidden crosshair.
  // `series` must be non-empty and `scales` computed from it.
  bool render(const BarSeries& series, const Scales& scales,
              const ChartViewport& viewport, std::uint64_t seriesVersion);

  // Replaces everything with a single centered message.
  bool renderPlaceholder(const std::string& text, const ChartViewport& viewport);

  // Removes all layers, leaving an empty canvas.
  bool clear();

  // Moves or hides the crosshair. Not counted as a redraw.
  bool updateCrosshair(std::optional<double> x);

  std::uint64_t redrawCount() const { return redrawCount_; }
  std::optional<std::uint64_t> renderedSeriesVersion() const { return renderedVersion_; }
  const std::string& placeholderText() const { return placeholder_; }

  const Canvas* canvas() const { return canvas_.get(); }

  // Ids of the mounted recipes' draw items, in mount order.
  std::vector<Id> mountedDrawItemIds() const;

private:
  struct Mounted {
    std::unique_ptr<Recipe> recipe;
    RecipeBuildResult built;
  };

  bool apply(const std::string& cmd);
  bool mount(std::unique_ptr<Recipe> recipe);
  bool teardown();
  bool createLayers();
  bool uploadFloats(Id bufferId, Id geometryId, const std::vector<float>& data,
                    std::uint32_t vertexCount);
  bool uploadLabels(Id bufferId, Id geometryId, std::vector<TextLabel> labels);
  bool beginFrame();
  bool commitFrame();
  void present();

  ChartRendererConfig config_;
  std::unique_ptr<Canvas> canvas_;
  FramePresenter* presenter_{nullptr};

  std::vector<Mounted> mounted_;
  const CrosshairRecipe* crosshair_{nullptr};
  PaneLayout layout_;
  ChartViewport viewport_;

  std::uint64_t redrawCount_{0};
  std::optional<std::uint64_t> renderedVersion_;
  std::string placeholder_;
};

} // namespace sl
