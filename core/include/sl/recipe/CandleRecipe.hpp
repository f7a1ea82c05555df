#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/data/Bar.hpp"
#include "sl/layout/Scales.hpp"
#include <string>
#include <vector>

namespace sl {

// Wicks and bodies, split by direction so each draw item has one color.
// Wicks live on their own layer beneath the bodies.
//
// ID layout (offsets from idBase):
//   0-2:  up wicks    (Buffer, Geometry, DrawItem line2d@1)
//   3-5:  down wicks  (Buffer, Geometry, DrawItem line2d@1)
//   6-8:  up bodies   (Buffer, Geometry, DrawItem instancedRect@1)
//   9-11: down bodies (Buffer, Geometry, DrawItem instancedRect@1)
struct CandleRecipeConfig {
  Id wickLayerId{0};
  Id bodyLayerId{0};
  std::string name{"candles"};
  float colorUp[4] = {0.133f, 0.773f, 0.369f, 1.0f};
  float colorDown[4] = {0.937f, 0.267f, 0.267f, 1.0f};
  float minBodyHeight{1.0f};
};

struct CandleData {
  std::vector<float> wickUp;     // pos2 pairs
  std::vector<float> wickDown;
  std::vector<float> bodyUp;     // rect4 x0,y0,x1,y1
  std::vector<float> bodyDown;
  std::uint32_t upCount{0};
  std::uint32_t downCount{0};
};

class CandleRecipe : public Recipe {
public:
  CandleRecipe(Id idBase, const CandleRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override;

  CandleData computeCandles(const Scales& scales, const std::vector<Bar>& bars) const;

  Id wickUpBufferId() const     { return rid(0); }
  Id wickUpGeometryId() const   { return rid(1); }
  Id wickUpDrawItemId() const   { return rid(2); }
  Id wickDownBufferId() const   { return rid(3); }
  Id wickDownGeometryId() const { return rid(4); }
  Id wickDownDrawItemId() const { return rid(5); }
  Id bodyUpBufferId() const     { return rid(6); }
  Id bodyUpGeometryId() const   { return rid(7); }
  Id bodyUpDrawItemId() const   { return rid(8); }
  Id bodyDownBufferId() const   { return rid(9); }
  Id bodyDownGeometryId() const { return rid(10); }
  Id bodyDownDrawItemId() const { return rid(11); }

  static constexpr std::uint32_t ID_SLOTS = 12;

private:
  CandleRecipeConfig config_;
};

} // namespace sl
