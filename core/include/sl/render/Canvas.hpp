#pragma once
#include "sl/buffers/BufferStore.hpp"
#include "sl/commands/CommandProcessor.hpp"
#include "sl/scene/ResourceRegistry.hpp"
#include "sl/scene/Scene.hpp"

namespace sl {

// CPU drawing surface: the retained scene, its id registry, buffer contents
// and the command processor that mutates them. Owned by ChartRenderer.
struct Canvas {
  Scene scene;
  ResourceRegistry registry;
  BufferStore buffers;
  CommandProcessor commands{scene, registry};

  Canvas() = default;
  Canvas(const Canvas&) = delete;
  Canvas& operator=(const Canvas&) = delete;
};

} // namespace sl
