#include "sl/recipe/CandleRecipe.hpp"
#include <algorithm>
#include <cmath>

namespace sl {

CandleRecipe::CandleRecipe(Id idBase, const CandleRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult CandleRecipe::build() const {
  RecipeBuildResult result;

  auto add = [&](std::uint32_t base, Id layerId, const char* suffix,
                 VertexFormat fmt, const char* pipeline, const float* color) {
    PrimitiveSpec p;
    p.bufferId = rid(base);
    p.geometryId = rid(base + 1);
    p.drawItemId = rid(base + 2);
    p.layerId = layerId;
    p.name = config_.name + suffix;
    p.format = fmt;
    p.pipeline = pipeline;
    for (int i = 0; i < 4; i++) p.color[i] = color[i];
    appendPrimitive(result, p);
  };

  add(0, config_.wickLayerId, ".wickUp", VertexFormat::Pos2, kLinePipeline, config_.colorUp);
  add(3, config_.wickLayerId, ".wickDown", VertexFormat::Pos2, kLinePipeline, config_.colorDown);
  add(6, config_.bodyLayerId, ".bodyUp", VertexFormat::Rect4, kRectPipeline, config_.colorUp);
  add(9, config_.bodyLayerId, ".bodyDown", VertexFormat::Rect4, kRectPipeline, config_.colorDown);
  return result;
}

std::vector<Id> CandleRecipe::drawItemIds() const {
  return {wickUpDrawItemId(), wickDownDrawItemId(), bodyUpDrawItemId(), bodyDownDrawItemId()};
}

CandleData CandleRecipe::computeCandles(const Scales& scales, const std::vector<Bar>& bars) const {
  CandleData data;
  const double bw = scales.bandwidth();

  for (std::size_t i = 0; i < bars.size(); i++) {
    const Bar& b = bars[i];
    const bool up = b.isUp();

    const float cx = static_cast<float>(scales.time.center(i));
    const float yHigh = static_cast<float>(scales.price(b.high));
    const float yLow = static_cast<float>(scales.price(b.low));
    auto& wick = up ? data.wickUp : data.wickDown;
    wick.insert(wick.end(), {cx, yHigh, cx, yLow});

    // Body from max(open, close) downward; at least minBodyHeight tall.
    const double yTop = scales.price(std::max(b.open, b.close));
    const double h = std::max(static_cast<double>(config_.minBodyHeight),
                              std::fabs(scales.price(b.open) - scales.price(b.close)));
    const float x0 = static_cast<float>(scales.time.x(i));
    const float x1 = static_cast<float>(scales.time.x(i) + bw);
    auto& body = up ? data.bodyUp : data.bodyDown;
    body.insert(body.end(), {x0, static_cast<float>(yTop), x1, static_cast<float>(yTop + h)});

    if (up) data.upCount++;
    else data.downCount++;
  }
  return data;
}

} // namespace sl
