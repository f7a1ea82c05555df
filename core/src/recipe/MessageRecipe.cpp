#include "sl/recipe/MessageRecipe.hpp"

namespace sl {

MessageRecipe::MessageRecipe(Id idBase, const MessageRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult MessageRecipe::build() const {
  RecipeBuildResult result;
  PrimitiveSpec p;
  p.bufferId = bufferId();
  p.geometryId = geometryId();
  p.drawItemId = drawItemId();
  p.layerId = config_.layerId;
  p.name = config_.name;
  p.format = VertexFormat::Label;
  p.pipeline = kTextPipeline;
  for (int i = 0; i < 4; i++) p.color[i] = config_.color[i];
  p.fontSize = config_.fontSize;
  appendPrimitive(result, p);
  return result;
}

std::vector<TextLabel> MessageRecipe::computeMessage(const std::string& text,
                                                     const ChartViewport& vp) const {
  if (text.empty()) return {};
  TextLabel l;
  l.x = static_cast<float>(vp.width * 0.5);
  l.y = static_cast<float>(vp.height * 0.5);
  l.anchor = TextAnchor::Middle;
  l.text = text;
  return {l};
}

} // namespace sl
