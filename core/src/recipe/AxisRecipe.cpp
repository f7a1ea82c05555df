#include "sl/recipe/AxisRecipe.hpp"
#include "sl/math/ValueFormat.hpp"

namespace sl {

std::size_t timeTickStride(std::size_t barCount) {
  if (barCount <= 8) return 1;
  return (barCount + 7) / 8;
}

AxisRecipe::AxisRecipe(Id idBase, const AxisRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult AxisRecipe::build() const {
  RecipeBuildResult result;

  PrimitiveSpec ticks;
  ticks.bufferId = tickBufferId();
  ticks.geometryId = tickGeometryId();
  ticks.drawItemId = tickDrawItemId();
  ticks.layerId = config_.layerId;
  ticks.name = config_.name + ".ticks";
  for (int i = 0; i < 4; i++) ticks.color[i] = config_.tickColor[i];
  appendPrimitive(result, ticks);

  PrimitiveSpec domain;
  domain.bufferId = domainBufferId();
  domain.geometryId = domainGeometryId();
  domain.drawItemId = domainDrawItemId();
  domain.layerId = config_.layerId;
  domain.name = config_.name + ".domain";
  for (int i = 0; i < 4; i++) domain.color[i] = config_.domainColor[i];
  appendPrimitive(result, domain);

  PrimitiveSpec labels;
  labels.bufferId = labelBufferId();
  labels.geometryId = labelGeometryId();
  labels.drawItemId = labelDrawItemId();
  labels.layerId = config_.layerId;
  labels.name = config_.name + ".labels";
  labels.format = VertexFormat::Label;
  labels.pipeline = kTextPipeline;
  labels.fontSize = config_.fontSize;
  for (int i = 0; i < 4; i++) labels.color[i] = config_.labelColor[i];
  appendPrimitive(result, labels);

  return result;
}

AxisData AxisRecipe::computeAxes(const Scales& scales, const std::vector<Bar>& bars) const {
  AxisData data;
  const PaneLayout& pl = scales.layout;
  const float axisX = static_cast<float>(pl.plot.right);
  const float tick = config_.tickSize;
  const float labelX = axisX + tick + config_.labelPadding;

  // Price axis: no domain line, ticks + "$" labels
  for (double v : scales.price.ticks(config_.priceTickCount).values) {
    const float y = static_cast<float>(scales.price(v));
    data.ticks.insert(data.ticks.end(), {axisX, y, axisX + tick, y});
    data.labels.push_back({labelX, y, TextAnchor::Start, formatPriceTick(v)});
    data.priceTicks.push_back(v);
  }

  // Volume axis
  for (double v : scales.volume.ticks(config_.volumeTickCount).values) {
    const float y = static_cast<float>(scales.volume(v));
    data.ticks.insert(data.ticks.end(), {axisX, y, axisX + tick, y});
    data.labels.push_back({labelX, y, TextAnchor::Start, formatVolumeTick(v)});
    data.volumeTicks.push_back(v);
  }

  // Time axis along the bottom of the plot
  const float axisY = static_cast<float>(pl.plot.bottom);
  data.domain.insert(data.domain.end(),
                     {static_cast<float>(pl.plot.left), axisY,
                      static_cast<float>(pl.plot.right), axisY});

  const std::size_t stride = timeTickStride(bars.size());
  for (std::size_t i = 0; i < bars.size(); i += stride) {
    const float x = static_cast<float>(scales.time.center(i));
    data.ticks.insert(data.ticks.end(), {x, axisY, x, axisY + tick});
    data.labels.push_back({x, axisY + tick + config_.labelPadding + config_.fontSize * 0.5f,
                           TextAnchor::Middle, bars[i].time});
    data.timeTickIndices.push_back(i);
  }

  return data;
}

} // namespace sl
