#include "sl/buffers/BufferStore.hpp"
#include <cstring>
#include <utility>

namespace sl {

void BufferStore::ensureBuffer(Id id) {
  if (buffers_.find(id) == buffers_.end()) {
    CpuBuffer b;
    b.id = id;
    buffers_[id] = std::move(b);
  }
}

void BufferStore::setBufferData(Id id, const void* data, std::uint32_t len) {
  ensureBuffer(id);
  CpuBuffer& buf = buffers_[id];
  buf.data.resize(len);
  if (len > 0) std::memcpy(buf.data.data(), data, len);
  buf.revision = nextRevision_++;
}

void BufferStore::setFloats(Id id, const std::vector<float>& values) {
  setBufferData(id, values.data(),
                static_cast<std::uint32_t>(values.size() * sizeof(float)));
}

void BufferStore::setLabels(Id id, std::vector<TextLabel> labels) {
  ensureBuffer(id);
  CpuBuffer& buf = buffers_[id];
  buf.labels = std::move(labels);
  buf.revision = nextRevision_++;
}

const std::uint8_t* BufferStore::getBufferData(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return nullptr;
  return it->second.data.data();
}

std::uint32_t BufferStore::getBufferSize(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return 0;
  return static_cast<std::uint32_t>(it->second.data.size());
}

const std::vector<TextLabel>* BufferStore::getLabels(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return nullptr;
  return &it->second.labels;
}

std::vector<float> BufferStore::floatsOf(Id id) const {
  std::vector<float> out;
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return out;
  out.resize(it->second.data.size() / sizeof(float));
  if (!out.empty()) std::memcpy(out.data(), it->second.data.data(), out.size() * sizeof(float));
  return out;
}

std::uint64_t BufferStore::revision(Id id) const {
  auto it = buffers_.find(id);
  return it == buffers_.end() ? 0 : it->second.revision;
}

void BufferStore::syncBufferLengths(Scene& scene) const {
  for (const auto& kv : buffers_) {
    Buffer* b = scene.getBufferMutable(kv.first);
    if (b) b->byteLength = static_cast<std::uint32_t>(kv.second.data.size());
  }
}

std::size_t BufferStore::pruneMissing(const Scene& scene) {
  std::size_t removed = 0;
  for (auto it = buffers_.begin(); it != buffers_.end();) {
    if (!scene.hasBuffer(it->first)) {
      it = buffers_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

void BufferStore::clear() {
  buffers_.clear();
}

} // namespace sl
