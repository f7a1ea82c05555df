#pragma once
#include "sl/ids/Id.hpp"
#include "sl/scene/Scene.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sl {

enum class TextAnchor : std::uint8_t { Start, Middle, End };

// One text run positioned in canvas pixels. (x, y) is the anchor point on
// the vertical middle of the text.
struct TextLabel {
  float x{0};
  float y{0};
  TextAnchor anchor{TextAnchor::Start};
  std::string text;
};

// CPU-side contents of scene buffers: float vertex bytes for pos2/rect4
// geometries and label lists for label geometries.
class BufferStore {
public:
  void ensureBuffer(Id id);
  void setBufferData(Id id, const void* data, std::uint32_t len);
  void setFloats(Id id, const std::vector<float>& values);
  void setLabels(Id id, std::vector<TextLabel> labels);

  const std::uint8_t* getBufferData(Id id) const;
  std::uint32_t getBufferSize(Id id) const;
  const std::vector<TextLabel>* getLabels(Id id) const;

  // Copies of float data, for inspection.
  std::vector<float> floatsOf(Id id) const;

  // Store-wide write counter stamped on each write; presenters re-upload
  // when a buffer's stamp moves.
  std::uint64_t revision(Id id) const;

  // Mirror byte lengths into the scene's Buffer records.
  void syncBufferLengths(Scene& scene) const;

  // Drop data for buffers that no longer exist in the scene.
  std::size_t pruneMissing(const Scene& scene);
  void clear();

  std::size_t bufferCount() const { return buffers_.size(); }

private:
  struct CpuBuffer {
    Id id{0};
    std::vector<std::uint8_t> data;
    std::vector<TextLabel> labels;
    std::uint64_t revision{0};
  };

  std::unordered_map<Id, CpuBuffer> buffers_;
  std::uint64_t nextRevision_{1};
};

} // namespace sl
