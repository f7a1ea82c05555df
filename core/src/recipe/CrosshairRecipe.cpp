#include "sl/recipe/CrosshairRecipe.hpp"
#include "sl/math/Dash.hpp"

namespace sl {

CrosshairRecipe::CrosshairRecipe(Id idBase, const CrosshairRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult CrosshairRecipe::build() const {
  RecipeBuildResult result;
  PrimitiveSpec p;
  p.bufferId = bufferId();
  p.geometryId = geometryId();
  p.drawItemId = drawItemId();
  p.layerId = config_.layerId;
  p.name = config_.name;
  p.format = VertexFormat::Pos2;
  p.pipeline = kLinePipeline;
  for (int i = 0; i < 4; i++) p.color[i] = config_.color[i];
  p.lineWidth = config_.lineWidth;
  appendPrimitive(result, p);
  return result;
}

CrosshairData CrosshairRecipe::computeCrosshair(std::optional<double> x,
                                                const PaneLayout& layout) const {
  CrosshairData data;
  if (!x) return data;

  const float fx = static_cast<float>(*x);
  appendDashedLine(data.segments,
                   fx, static_cast<float>(layout.plot.top),
                   fx, static_cast<float>(layout.plot.bottom),
                   config_.dashOn, config_.dashOff);
  data.vertexCount = static_cast<std::uint32_t>(data.segments.size() / 2);
  data.visible = data.vertexCount > 0;
  return data;
}

} // namespace sl
