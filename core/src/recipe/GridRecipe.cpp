#include "sl/recipe/GridRecipe.hpp"
#include "sl/math/Dash.hpp"

namespace sl {

GridRecipe::GridRecipe(Id idBase, const GridRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult GridRecipe::build() const {
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

GridData GridRecipe::computeGrid(const Scales& scales) const {
  GridData data;
  const PlotArea& plot = scales.layout.plot;
  TickSet ticks = scales.price.ticks(config_.tickCount);

  for (double v : ticks.values) {
    const float y = static_cast<float>(scales.price(v));
    appendDashedLine(data.segments,
                     static_cast<float>(plot.left), y,
                     static_cast<float>(plot.right), y,
                     config_.dashOn, config_.dashOff);
    data.tickValues.push_back(v);
  }
  data.vertexCount = static_cast<std::uint32_t>(data.segments.size() / 2);
  return data;
}

} // namespace sl
