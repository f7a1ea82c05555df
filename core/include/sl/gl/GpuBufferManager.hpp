#pragma once
#include "sl/buffers/BufferStore.hpp"
#include "sl/ids/Id.hpp"
#include "sl/scene/Scene.hpp"
#include <glad/gl.h>
#include <cstdint>
#include <unordered_map>

namespace sl {

// Mirrors the canvas' byte buffers into GL VBOs. A buffer is re-uploaded
// when its BufferStore revision moves; VBOs of deleted buffers are freed.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  // Returns total bytes uploaded.
  std::uint64_t sync(const Scene& scene, const BufferStore& store);

  // 0 if the buffer has no VBO (never uploaded or empty).
  GLuint getGlBuffer(Id bufferId) const;

  void releaseAll();

private:
  struct Entry {
    GLuint vbo{0};
    std::uint64_t revision{0};
  };
  std::unordered_map<Id, Entry> entries_;
};

} // namespace sl
