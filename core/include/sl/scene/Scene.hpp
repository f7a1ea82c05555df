#pragma once
#include "sl/scene/Types.hpp"
#include "sl/scene/Geometry.hpp"
#include <unordered_map>
#include <vector>

namespace sl {

// Retained drawing graph: Pane -> Layer -> DrawItem, plus buffers and
// geometries referenced by draw items.
class Scene {
public:
  bool hasPane(Id id) const;
  bool hasLayer(Id id) const;
  bool hasDrawItem(Id id) const;
  bool hasBuffer(Id id) const;
  bool hasGeometry(Id id) const;

  const Pane*     getPane(Id id) const;
  const Layer*    getLayer(Id id) const;
  const DrawItem* getDrawItem(Id id) const;
  const Buffer*   getBuffer(Id id) const;
  const Geometry* getGeometry(Id id) const;

  DrawItem* getDrawItemMutable(Id id);
  Geometry* getGeometryMutable(Id id);
  Buffer*   getBufferMutable(Id id);

  void addPane(Pane p);
  void addLayer(Layer l);
  void addDrawItem(DrawItem d);
  void addBuffer(Buffer b);
  void addGeometry(Geometry g);

  // Delete (cascades) and return every deleted ID.
  // - deletePane => {paneId, layerIds..., drawItemIds...}
  // - deleteLayer => {layerId, drawItemIds...}
  std::vector<Id> deletePane(Id paneId);
  std::vector<Id> deleteLayer(Id layerId);
  std::vector<Id> deleteDrawItem(Id drawItemId);
  std::vector<Id> deleteBuffer(Id bufferId);
  std::vector<Id> deleteGeometry(Id geometryId);

  // Ascending ID order; this is also the draw order.
  std::vector<Id> paneIds() const;
  std::vector<Id> layerIds() const;
  std::vector<Id> drawItemIds() const;
  std::vector<Id> bufferIds() const;
  std::vector<Id> geometryIds() const;

  bool empty() const;

private:
  std::unordered_map<Id, Pane> panes_;
  std::unordered_map<Id, Layer> layers_;
  std::unordered_map<Id, DrawItem> drawItems_;
  std::unordered_map<Id, Buffer> buffers_;
  std::unordered_map<Id, Geometry> geometries_;
};

} // namespace sl
