#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/buffers/BufferStore.hpp"
#include "sl/layout/ChartViewport.hpp"

#include <string>
#include <vector>

namespace sl {

// Single centered text label, used for the "no data" placeholder.
//
// ID layout (offsets from idBase):
//   0: Buffer (labels)
//   1: Geometry
//   2: DrawItem (text@1)
struct MessageRecipeConfig {
  Id layerId{0};
  std::string name{"message"};
  float color[4] = {0.580f, 0.639f, 0.722f, 1.0f};
  float fontSize{14.0f};
};

class MessageRecipe : public Recipe {
public:
  MessageRecipe(Id idBase, const MessageRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  std::vector<TextLabel> computeMessage(const std::string& text, const ChartViewport& vp) const;

  Id bufferId() const   { return rid(0); }
  Id geometryId() const { return rid(1); }
  Id drawItemId() const { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

private:
  MessageRecipeConfig config_;
};

} // namespace sl
