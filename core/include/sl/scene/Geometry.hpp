#pragma once
#include "sl/ids/Id.hpp"
#include <cstdint>
#include <string>

namespace sl {

// All vertex data is in canvas pixels, origin top-left, y down.
enum class VertexFormat : std::uint8_t {
  Pos2 = 1,   // x,y per vertex; pairs form line segments
  Rect4 = 2,  // x0,y0,x1,y1 per instance
  Label = 3   // one TextLabel per instance (held by BufferStore)
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2: return "pos2";
    case VertexFormat::Rect4: return "rect4";
    case VertexFormat::Label: return "label";
    default: return "unknown";
  }
}

inline bool parseVertexFormat(const std::string& s, VertexFormat& out) {
  if (s == "pos2")  { out = VertexFormat::Pos2;  return true; }
  if (s == "rect4") { out = VertexFormat::Rect4; return true; }
  if (s == "label") { out = VertexFormat::Label; return true; }
  return false;
}

// Bytes per vertex / instance. Labels are not byte data.
inline std::uint32_t strideOf(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2: return 8;
    case VertexFormat::Rect4: return 16;
    default: return 0;
  }
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2};
  std::uint32_t vertexCount{0};
};

} // namespace sl
