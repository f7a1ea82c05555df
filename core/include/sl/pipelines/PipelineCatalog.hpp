#pragma once
#include "sl/scene/Geometry.hpp"
#include <cstdint>
#include <string>

namespace sl {

// The three ways a chart draw item reaches the screen.
enum class PipelineKind : std::uint8_t {
  Line2d,         // pos2 vertex pairs: grid, wicks, MA polylines, crosshair
  InstancedRect,  // rect4 instances: candle bodies, volume bars
  Text            // label instances: axis ticks, placeholder message
};

inline constexpr const char* kLinePipeline = "line2d@1";
inline constexpr const char* kRectPipeline = "instancedRect@1";
inline constexpr const char* kTextPipeline = "text@1";

struct PipelineSpec {
  const char* key;
  PipelineKind kind;
  VertexFormat requiredVertexFormat;
  std::uint32_t vertexMultiple;  // vertexCount must be a multiple of this
};

// nullptr for keys outside the catalog.
const PipelineSpec* findPipeline(const std::string& key);

} // namespace sl
