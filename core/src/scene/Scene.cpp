#include "sl/scene/Scene.hpp"
#include <algorithm>
#include <utility>

namespace sl {

template <typename Map>
static auto* findIn(Map& m, Id id) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

template <typename Map>
static std::vector<Id> sortedKeys(const Map& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (const auto& kv : m) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

bool Scene::hasPane(Id id) const     { return panes_.count(id) != 0; }
bool Scene::hasLayer(Id id) const    { return layers_.count(id) != 0; }
bool Scene::hasDrawItem(Id id) const { return drawItems_.count(id) != 0; }
bool Scene::hasBuffer(Id id) const   { return buffers_.count(id) != 0; }
bool Scene::hasGeometry(Id id) const { return geometries_.count(id) != 0; }

const Pane* Scene::getPane(Id id) const         { return findIn(panes_, id); }
const Layer* Scene::getLayer(Id id) const       { return findIn(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const { return findIn(drawItems_, id); }
const Buffer* Scene::getBuffer(Id id) const     { return findIn(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const { return findIn(geometries_, id); }

DrawItem* Scene::getDrawItemMutable(Id id) { return findIn(drawItems_, id); }
Geometry* Scene::getGeometryMutable(Id id) { return findIn(geometries_, id); }
Buffer* Scene::getBufferMutable(Id id)     { return findIn(buffers_, id); }

void Scene::addPane(Pane p)         { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)       { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d) { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)     { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g) { geometries_[g.id] = std::move(g); }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  if (drawItems_.erase(drawItemId) == 0) return {};
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  auto it = layers_.find(layerId);
  if (it == layers_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(layerId);

  std::vector<Id> toDelete;
  for (auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) toDelete.push_back(kv.first);
  }
  std::sort(toDelete.begin(), toDelete.end());
  for (Id id : toDelete) {
    drawItems_.erase(id);
    deleted.push_back(id);
  }

  layers_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  auto it = panes_.find(paneId);
  if (it == panes_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(paneId);

  std::vector<Id> layersToDelete;
  for (auto& kv : layers_) {
    if (kv.second.paneId == paneId) layersToDelete.push_back(kv.first);
  }
  std::sort(layersToDelete.begin(), layersToDelete.end());
  for (Id lid : layersToDelete) {
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }

  panes_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  if (buffers_.erase(bufferId) == 0) return {};
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  if (geometries_.erase(geometryId) == 0) return {};
  return {geometryId};
}

std::vector<Id> Scene::paneIds() const     { return sortedKeys(panes_); }
std::vector<Id> Scene::layerIds() const    { return sortedKeys(layers_); }
std::vector<Id> Scene::drawItemIds() const { return sortedKeys(drawItems_); }
std::vector<Id> Scene::bufferIds() const   { return sortedKeys(buffers_); }
std::vector<Id> Scene::geometryIds() const { return sortedKeys(geometries_); }

bool Scene::empty() const {
  return panes_.empty() && layers_.empty() && drawItems_.empty() &&
         buffers_.empty() && geometries_.empty();
}

} // namespace sl
