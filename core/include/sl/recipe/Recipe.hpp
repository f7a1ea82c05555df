#pragma once
#include "sl/ids/Id.hpp"
#include "sl/pipelines/PipelineCatalog.hpp"
#include "sl/scene/Geometry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sl {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands;  // already in teardown order
};

// One buffer -> geometry -> drawItem chain bound to a pipeline.
struct PrimitiveSpec {
  Id bufferId{0};
  Id geometryId{0};
  Id drawItemId{0};
  Id layerId{0};
  std::string name;
  VertexFormat format{VertexFormat::Pos2};
  const char* pipeline{kLinePipeline};
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float lineWidth{1.0f};
  float fontSize{0.0f};  // only emitted when > 0
};

// Appends create and dispose commands for `spec`. Disposal runs
// drawItem -> geometry -> buffer.
void appendPrimitive(RecipeBuildResult& out, const PrimitiveSpec& spec);

// Base class for all recipes. A recipe translates a declarative description
// into engine commands using deterministic ID allocation (idBase + offset).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }
};

} // namespace sl
