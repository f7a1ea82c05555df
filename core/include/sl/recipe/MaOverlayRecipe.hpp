#pragma once
#include "sl/recipe/Recipe.hpp"
#include "sl/data/Bar.hpp"
#include "sl/layout/Scales.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sl {

enum class MaSource : std::uint8_t { Price, Volume };

// One moving-average line for one window, drawn as a smoothed polyline over
// the band centers. Missing values break the line into separate runs.
//
// ID layout (offsets from idBase):
//   0: Buffer (pos2 segments)
//   1: Geometry
//   2: DrawItem (line2d@1)
struct MaOverlayConfig {
  Id layerId{0};
  std::string name{"ma"};
  std::size_t windowIndex{0};
  MaSource source{MaSource::Price};
  float color[4] = {0.231f, 0.510f, 0.965f, 1.0f};
  float lineWidth{1.5f};
  int samplesPerSegment{8};
};

// Contiguous indices [first, first + count) with a value present.
struct MaRun {
  std::size_t first{0};
  std::size_t count{0};
};

struct MaOverlayData {
  std::vector<float> segments;  // pos2 pairs
  std::uint32_t vertexCount{0};
  std::vector<MaRun> runs;
};

class MaOverlayRecipe : public Recipe {
public:
  MaOverlayRecipe(Id idBase, const MaOverlayConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  MaOverlayData computeOverlay(const Scales& scales, const std::vector<Bar>& bars) const;

  static std::vector<MaRun> splitRuns(const std::vector<std::optional<double>>& values);

  const MaOverlayConfig& config() const { return config_; }

  Id bufferId() const   { return rid(0); }
  Id geometryId() const { return rid(1); }
  Id drawItemId() const { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

private:
  MaOverlayConfig config_;
};

} // namespace sl
