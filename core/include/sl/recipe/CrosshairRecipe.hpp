#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/layout/ChartViewport.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sl {

// Vertical dashed line at the hovered band center, spanning both panes.
//
// ID layout (offsets from idBase):
//   0: Buffer (pos2 segments)
//   1: Geometry
//   2: DrawItem (line2d@1)
struct CrosshairRecipeConfig {
  Id layerId{0};
  std::string name{"crosshair"};
  float color[4] = {0.388f, 0.400f, 0.945f, 1.0f};
  float dashOn{3.0f};
  float dashOff{3.0f};
  float lineWidth{1.0f};
};

struct CrosshairData {
  std::vector<float> segments;
  std::uint32_t vertexCount{0};
  bool visible{false};
};

class CrosshairRecipe : public Recipe {
public:
  CrosshairRecipe(Id idBase, const CrosshairRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  // Hidden (zero vertices) when `x` is empty.
  CrosshairData computeCrosshair(std::optional<double> x, const PaneLayout& layout) const;

  Id bufferId() const   { return rid(0); }
  Id geometryId() const { return rid(1); }
  Id drawItemId() const { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

private:
  CrosshairRecipeConfig config_;
};

} // namespace sl
