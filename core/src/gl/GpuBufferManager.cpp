#include "sl/gl/GpuBufferManager.hpp"
#include <vector>

namespace sl {

GpuBufferManager::~GpuBufferManager() {
  releaseAll();
}

void GpuBufferManager::releaseAll() {
  for (auto& [id, e] : entries_) {
    if (e.vbo) glDeleteBuffers(1, &e.vbo);
  }
  entries_.clear();
}

std::uint64_t GpuBufferManager::sync(const Scene& scene, const BufferStore& store) {
  // Drop VBOs whose buffer is gone.
  std::vector<Id> gone;
  for (const auto& [id, e] : entries_) {
    if (!scene.hasBuffer(id)) gone.push_back(id);
  }
  for (Id id : gone) {
    GLuint vbo = entries_[id].vbo;
    if (vbo) glDeleteBuffers(1, &vbo);
    entries_.erase(id);
  }

  std::uint64_t uploaded = 0;
  for (Id id : scene.bufferIds()) {
    const std::uint32_t bytes = store.getBufferSize(id);
    if (bytes == 0) continue;

    Entry& e = entries_[id];
    const std::uint64_t rev = store.revision(id);
    if (e.vbo && e.revision == rev) continue;

    if (!e.vbo) glGenBuffers(1, &e.vbo);
    glBindBuffer(GL_ARRAY_BUFFER, e.vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes),
                 store.getBufferData(id), GL_DYNAMIC_DRAW);
    e.revision = rev;
    uploaded += bytes;
  }
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return uploaded;
}

GLuint GpuBufferManager::getGlBuffer(Id bufferId) const {
  auto it = entries_.find(bufferId);
  if (it == entries_.end()) return 0;
  return it->second.vbo;
}

} // namespace sl
