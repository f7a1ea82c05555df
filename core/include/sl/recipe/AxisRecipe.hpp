#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/buffers/BufferStore.hpp"
#include "sl/data/Bar.hpp"
#include "sl/layout/Scales.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sl {

// Price axis (right edge of the price pane), volume axis (right edge of the
// volume pane) and time axis (bottom of the plot).
//
// ID layout (offsets from idBase):
//   0-2: tick marks   (Buffer, Geometry, DrawItem line2d@1)
//   3-5: domain line  (Buffer, Geometry, DrawItem line2d@1)
//   6-8: tick labels  (Buffer, Geometry, DrawItem text@1)
struct AxisRecipeConfig {
  Id layerId{0};
  std::string name{"axes"};
  int priceTickCount{6};
  int volumeTickCount{3};
  float tickSize{6.0f};
  float labelPadding{3.0f};
  float fontSize{10.0f};
  float tickColor[4] = {0.278f, 0.333f, 0.412f, 1.0f};
  float domainColor[4] = {0.118f, 0.161f, 0.231f, 1.0f};
  float labelColor[4] = {0.580f, 0.639f, 0.722f, 1.0f};
};

struct AxisData {
  std::vector<float> ticks;     // pos2 pairs
  std::vector<float> domain;    // pos2 pairs
  std::vector<TextLabel> labels;

  std::vector<double> priceTicks;
  std::vector<double> volumeTicks;
  std::vector<std::size_t> timeTickIndices;
};

// Label every stride-th bar so that at most ~8 time labels are shown.
std::size_t timeTickStride(std::size_t barCount);

class AxisRecipe : public Recipe {
public:
  AxisRecipe(Id idBase, const AxisRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override {
    return {tickDrawItemId(), domainDrawItemId(), labelDrawItemId()};
  }

  AxisData computeAxes(const Scales& scales, const std::vector<Bar>& bars) const;

  Id tickBufferId() const     { return rid(0); }
  Id tickGeometryId() const   { return rid(1); }
  Id tickDrawItemId() const   { return rid(2); }
  Id domainBufferId() const   { return rid(3); }
  Id domainGeometryId() const { return rid(4); }
  Id domainDrawItemId() const { return rid(5); }
  Id labelBufferId() const    { return rid(6); }
  Id labelGeometryId() const  { return rid(7); }
  Id labelDrawItemId() const  { return rid(8); }

  static constexpr std::uint32_t ID_SLOTS = 9;

private:
  AxisRecipeConfig config_;
};

} // namespace sl
