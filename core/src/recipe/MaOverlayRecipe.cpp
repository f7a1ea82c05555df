#include "sl/recipe/MaOverlayRecipe.hpp"
#include "sl/math/MonotoneCurve.hpp"

namespace sl {

MaOverlayRecipe::MaOverlayRecipe(Id idBase, const MaOverlayConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult MaOverlayRecipe::build() const {
  RecipeBuildResult result;
  PrimitiveSpec p;
  p.bufferId = bufferId();
  p.geometryId = geometryId();
  p.drawItemId = drawItemId();
  p.layerId = config_.layerId;
  p.name = config_.name;
  p.format = VertexFormat::Pos2;
  p.pipeline = kLinePipeline;
  for (int i = 0; i < 4; i++) p.color[i] = config_.color[i];
  p.lineWidth = config_.lineWidth;
  appendPrimitive(result, p);
  return result;
}

std::vector<MaRun> MaOverlayRecipe::splitRuns(const std::vector<std::optional<double>>& values) {
  std::vector<MaRun> runs;
  MaRun cur;
  bool open = false;
  for (std::size_t i = 0; i < values.size(); i++) {
    if (values[i].has_value()) {
      if (!open) {
        cur.first = i;
        cur.count = 0;
        open = true;
      }
      cur.count++;
    } else if (open) {
      runs.push_back(cur);
      open = false;
    }
  }
  if (open) runs.push_back(cur);
  return runs;
}

MaOverlayData MaOverlayRecipe::computeOverlay(const Scales& scales,
                                              const std::vector<Bar>& bars) const {
  MaOverlayData data;
  const bool volume = config_.source == MaSource::Volume;

  std::vector<std::optional<double>> values;
  values.reserve(bars.size());
  for (const auto& b : bars) {
    const auto& v = volume ? b.volMa : b.ma;
    values.push_back(config_.windowIndex < v.size() ? v[config_.windowIndex] : std::nullopt);
  }

  const LinearScale& y = volume ? scales.volume : scales.price;
  data.runs = splitRuns(values);

  for (const MaRun& run : data.runs) {
    // A lone point has no segment to draw.
    if (run.count < 2) continue;

    std::vector<CurvePoint> pts;
    pts.reserve(run.count);
    for (std::size_t i = run.first; i < run.first + run.count; i++) {
      pts.push_back({scales.time.center(i), y(*values[i])});
    }

    std::vector<CurvePoint> line = sampleMonotoneX(pts, config_.samplesPerSegment);
    for (std::size_t i = 1; i < line.size(); i++) {
      data.segments.push_back(static_cast<float>(line[i - 1].x));
      data.segments.push_back(static_cast<float>(line[i - 1].y));
      data.segments.push_back(static_cast<float>(line[i].x));
      data.segments.push_back(static_cast<float>(line[i].y));
    }
  }

  data.vertexCount = static_cast<std::uint32_t>(data.segments.size() / 2);
  return data;
}

} // namespace sl
