#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/layout/Scales.hpp"
#include <string>
#include <vector>

namespace sl {

// Dashed horizontal grid lines at the price ticks.
//
// ID layout (offsets from idBase):
//   0: Buffer (pos2 segments)
//   1: Geometry
//   2: DrawItem (line2d@1)
struct GridRecipeConfig {
  Id layerId{0};
  std::string name{"grid"};
  int tickCount{6};
  float color[4] = {0.118f, 0.161f, 0.231f, 1.0f};
  float dashOn{2.0f};
  float dashOff{2.0f};
  float lineWidth{1.0f};
};

struct GridData {
  std::vector<float> segments;   // pos2 pairs
  std::uint32_t vertexCount{0};
  std::vector<double> tickValues;
};

class GridRecipe : public Recipe {
public:
  GridRecipe(Id idBase, const GridRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  GridData computeGrid(const Scales& scales) const;

  Id bufferId() const   { return rid(0); }
  Id geometryId() const { return rid(1); }
  Id drawItemId() const { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

private:
  GridRecipeConfig config_;
};

} // namespace sl
