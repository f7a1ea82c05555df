#pragma once
#include "sl/ids/Id.hpp"
#include <cstddef>
#include <string>

namespace sl {

// Kinds of node in the chart scene graph. Values index kResourceKindNames.
enum class ResourceKind : std::uint8_t {
  Pane,
  Layer,
  DrawItem,
  Buffer,
  Geometry
};

inline constexpr std::size_t kResourceKindCount = 5;

inline constexpr const char* kResourceKindNames[kResourceKindCount] = {
  "pane", "layer", "drawItem", "buffer", "geometry"
};

inline const char* toString(ResourceKind k) {
  const auto i = static_cast<std::size_t>(k);
  return i < kResourceKindCount ? kResourceKindNames[i] : "unknown";
}

struct Pane {
  Id id{0};
  std::string name;
};

// Layers draw in ascending id order inside their pane.
struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  std::string pipeline;  // catalog key, e.g. kLinePipeline
  Id geometryId{0};

  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float lineWidth{1.0f};
  float fontSize{10.0f};
};

} // namespace sl
