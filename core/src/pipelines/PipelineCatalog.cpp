#include "sl/pipelines/PipelineCatalog.hpp"

namespace sl {

namespace {

const PipelineSpec kPipelines[] = {
  {kLinePipeline, PipelineKind::Line2d, VertexFormat::Pos2, 2},
  {kRectPipeline, PipelineKind::InstancedRect, VertexFormat::Rect4, 1},
  {kTextPipeline, PipelineKind::Text, VertexFormat::Label, 1},
};

} // namespace

const PipelineSpec* findPipeline(const std::string& key) {
  for (const PipelineSpec& p : kPipelines) {
    if (key == p.key) return &p;
  }
  return nullptr;
}

} // namespace sl
