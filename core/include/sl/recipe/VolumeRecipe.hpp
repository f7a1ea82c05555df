#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/data/Bar.hpp"
#include "sl/layout/Scales.hpp"
#include <string>
#include <vector>

namespace sl {

// Volume histogram in the volume pane, translucent up/down colors.
//
// ID layout (offsets from idBase):
//   0-2: up bars   (Buffer, Geometry, DrawItem instancedRect@1)
//   3-5: down bars (Buffer, Geometry, DrawItem instancedRect@1)
struct VolumeRecipeConfig {
  Id layerId{0};
  std::string name{"volume"};
  float colorUp[4] = {0.133f, 0.773f, 0.369f, 0.5f};
  float colorDown[4] = {0.937f, 0.267f, 0.267f, 0.5f};
};

struct VolumeBarData {
  std::vector<float> barsUp;    // rect4
  std::vector<float> barsDown;
  std::uint32_t upCount{0};
  std::uint32_t downCount{0};
};

class VolumeRecipe : public Recipe {
public:
  VolumeRecipe(Id idBase, const VolumeRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {upDrawItemId(), downDrawItemId()}; }

  VolumeBarData computeVolumeBars(const Scales& scales, const std::vector<Bar>& bars) const;

  Id upBufferId() const     { return rid(0); }
  Id upGeometryId() const   { return rid(1); }
  Id upDrawItemId() const   { return rid(2); }
  Id downBufferId() const   { return rid(3); }
  Id downGeometryId() const { return rid(4); }
  Id downDrawItemId() const { return rid(5); }

  static constexpr std::uint32_t ID_SLOTS = 6;

private:
  VolumeRecipeConfig config_;
};

} // namespace sl
