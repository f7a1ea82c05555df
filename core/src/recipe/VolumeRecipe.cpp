#include "sl/recipe/VolumeRecipe.hpp"

namespace sl {

VolumeRecipe::VolumeRecipe(Id idBase, const VolumeRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult VolumeRecipe::build() const {
  RecipeBuildResult result;

  PrimitiveSpec up;
  up.bufferId = upBufferId();
  up.geometryId = upGeometryId();
  up.drawItemId = upDrawItemId();
  up.layerId = config_.layerId;
  up.name = config_.name + ".up";
  up.format = VertexFormat::Rect4;
  up.pipeline = kRectPipeline;
  for (int i = 0; i < 4; i++) up.color[i] = config_.colorUp[i];
  appendPrimitive(result, up);

  PrimitiveSpec down = up;
  down.bufferId = downBufferId();
  down.geometryId = downGeometryId();
  down.drawItemId = downDrawItemId();
  down.name = config_.name + ".down";
  for (int i = 0; i < 4; i++) down.color[i] = config_.colorDown[i];
  appendPrimitive(result, down);

  return result;
}

VolumeBarData VolumeRecipe::computeVolumeBars(const Scales& scales,
                                              const std::vector<Bar>& bars) const {
  VolumeBarData data;
  const float base = static_cast<float>(scales.volume(0.0));
  const double bw = scales.bandwidth();

  for (std::size_t i = 0; i < bars.size(); i++) {
    const Bar& b = bars[i];
    const float x0 = static_cast<float>(scales.time.x(i));
    const float x1 = static_cast<float>(scales.time.x(i) + bw);
    const float top = static_cast<float>(scales.volume(b.volume));
    if (b.isUp()) {
      data.barsUp.insert(data.barsUp.end(), {x0, top, x1, base});
      data.upCount++;
    } else {
      data.barsDown.insert(data.barsDown.end(), {x0, top, x1, base});
      data.downCount++;
    }
  }
  return data;
}

} // namespace sl
