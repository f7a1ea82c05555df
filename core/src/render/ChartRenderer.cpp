#include "sl/render/ChartRenderer.hpp"
#include "sl/recipe/AxisRecipe.hpp"
#include "sl/recipe/CandleRecipe.hpp"
#include "sl/recipe/GridRecipe.hpp"
#include "sl/recipe/MaOverlayRecipe.hpp"
#include "sl/recipe/MessageRecipe.hpp"
#include "sl/recipe/VolumeRecipe.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace sl {

static void copyColor(float dst[4], const float src[4]) {
  for (int i = 0; i < 4; i++) dst[i] = src[i];
}

ChartRenderer::ChartRenderer(const ChartRendererConfig& config)
  : config_(config) {}

ChartRenderer::~ChartRenderer() = default;

bool ChartRenderer::acquire() {
  if (canvas_) return false;
  canvas_ = std::make_unique<Canvas>();
  return true;
}

void ChartRenderer::release() {
  mounted_.clear();
  crosshair_ = nullptr;
  canvas_.reset();
  renderedVersion_.reset();
  placeholder_.clear();
}

bool ChartRenderer::apply(const std::string& cmd) {
  CmdResult r = canvas_->commands.applyJsonText(cmd);
  if (!r.ok) {
    std::fprintf(stderr, "ChartRenderer: %s: %s %s\n",
                 r.err.code.c_str(), r.err.message.c_str(), r.err.details.c_str());
    return false;
  }
  return true;
}

bool ChartRenderer::mount(std::unique_ptr<Recipe> recipe) {
  Mounted m;
  m.built = recipe->build();
  m.recipe = std::move(recipe);
  for (const auto& cmd : m.built.createCommands) {
    if (!apply(cmd)) return false;
  }
  mounted_.push_back(std::move(m));
  return true;
}

bool ChartRenderer::teardown() {
  bool ok = true;
  for (auto it = mounted_.rbegin(); it != mounted_.rend(); ++it) {
    for (const auto& cmd : it->built.disposeCommands) {
      if (!apply(cmd)) ok = false;
    }
  }
  mounted_.clear();
  crosshair_ = nullptr;

  if (canvas_->scene.hasPane(kChartPaneId)) {
    if (!apply(R"({"cmd":"delete","id":)" + idStr(kChartPaneId) + "}")) ok = false;
  }
  // Leftovers from a recipe whose mount failed part way.
  for (Id id : canvas_->scene.geometryIds()) {
    if (!apply(R"({"cmd":"delete","id":)" + idStr(id) + "}")) ok = false;
  }
  for (Id id : canvas_->scene.bufferIds()) {
    if (!apply(R"({"cmd":"delete","id":)" + idStr(id) + "}")) ok = false;
  }
  canvas_->buffers.pruneMissing(canvas_->scene);
  return ok;
}

bool ChartRenderer::createLayers() {
  if (!apply(R"({"cmd":"createPane","id":)" + idStr(kChartPaneId) + R"(,"name":"chart"})")) {
    return false;
  }
  static const std::pair<Id, const char*> layers[] = {
    {kGridLayerId, "grid"},
    {kAxisLayerId, "axes"},
    {kWickLayerId, "wicks"},
    {kBodyLayerId, "bodies"},
    {kVolumeLayerId, "volume"},
    {kOverlayLayerId, "overlays"},
    {kCrosshairLayerId, "crosshair"},
    {kMessageLayerId, "message"},
  };
  for (const auto& l : layers) {
    if (!apply(R"({"cmd":"createLayer","id":)" + idStr(l.first) +
               R"(,"paneId":)" + idStr(kChartPaneId) +
               R"(,"name":")" + l.second + R"("})")) {
      return false;
    }
  }
  return true;
}

bool ChartRenderer::uploadFloats(Id bufferId, Id geometryId,
                                 const std::vector<float>& data,
                                 std::uint32_t vertexCount) {
  canvas_->buffers.setFloats(bufferId, data);
  return apply(R"({"cmd":"setGeometryVertexCount","geometryId":)" + idStr(geometryId) +
               R"(,"vertexCount":)" + std::to_string(vertexCount) + "}");
}

bool ChartRenderer::uploadLabels(Id bufferId, Id geometryId, std::vector<TextLabel> labels) {
  const auto count = static_cast<std::uint32_t>(labels.size());
  canvas_->buffers.setLabels(bufferId, std::move(labels));
  return apply(R"({"cmd":"setGeometryVertexCount","geometryId":)" + idStr(geometryId) +
               R"(,"vertexCount":)" + std::to_string(count) + "}");
}

bool ChartRenderer::beginFrame() {
  return apply(R"({"cmd":"beginFrame"})");
}

bool ChartRenderer::commitFrame() {
  canvas_->buffers.syncBufferLengths(canvas_->scene);
  return apply(R"({"cmd":"commitFrame"})");
}

void ChartRenderer::present() {
  if (!presenter_ || !canvas_) return;
  if (!presenter_->present(*canvas_, viewport_, config_.theme)) {
    std::fprintf(stderr, "ChartRenderer: presenter failed\n");
  }
}

bool ChartRenderer::render(const BarSeries& series, const Scales& scales,
                           const ChartViewport& viewport, std::uint64_t seriesVersion) {
  if (!canvas_) {
    std::fprintf(stderr, "ChartRenderer: render without an acquired canvas\n");
    return false;
  }
  if (series.empty()) {
    std::fprintf(stderr, "ChartRenderer: render called with an empty series\n");
    return false;
  }

  const Theme& theme = config_.theme;
  const auto& bars = series.bars();
  bool ok = beginFrame();
  ok = teardown() && ok;
  ok = ok && createLayers();

  // Grid
  GridRecipeConfig gridCfg;
  gridCfg.layerId = kGridLayerId;
  gridCfg.tickCount = config_.gridTickCount;
  copyColor(gridCfg.color, theme.gridColor);
  gridCfg.dashOn = theme.gridDash[0];
  gridCfg.dashOff = theme.gridDash[1];
  gridCfg.lineWidth = theme.gridLineWidth;
  auto grid = std::make_unique<GridRecipe>(kGridIdBase, gridCfg);
  GridData gridData = grid->computeGrid(scales);
  const GridRecipe* gridPtr = grid.get();
  ok = ok && mount(std::move(grid));
  ok = ok && uploadFloats(gridPtr->bufferId(), gridPtr->geometryId(),
                          gridData.segments, gridData.vertexCount);

  // Axes
  AxisRecipeConfig axisCfg;
  axisCfg.layerId = kAxisLayerId;
  axisCfg.priceTickCount = config_.priceTickCount;
  axisCfg.volumeTickCount = config_.volumeTickCount;
  axisCfg.fontSize = theme.labelFontSize;
  copyColor(axisCfg.tickColor, theme.tickColor);
  copyColor(axisCfg.domainColor, theme.gridColor);
  copyColor(axisCfg.labelColor, theme.labelColor);
  auto axis = std::make_unique<AxisRecipe>(kAxisIdBase, axisCfg);
  AxisData axisData = axis->computeAxes(scales, bars);
  const AxisRecipe* axisPtr = axis.get();
  ok = ok && mount(std::move(axis));
  ok = ok && uploadFloats(axisPtr->tickBufferId(), axisPtr->tickGeometryId(),
                          axisData.ticks, static_cast<std::uint32_t>(axisData.ticks.size() / 2));
  ok = ok && uploadFloats(axisPtr->domainBufferId(), axisPtr->domainGeometryId(),
                          axisData.domain, static_cast<std::uint32_t>(axisData.domain.size() / 2));
  ok = ok && uploadLabels(axisPtr->labelBufferId(), axisPtr->labelGeometryId(),
                          std::move(axisData.labels));

  // Candles
  CandleRecipeConfig candleCfg;
  candleCfg.wickLayerId = kWickLayerId;
  candleCfg.bodyLayerId = kBodyLayerId;
  copyColor(candleCfg.colorUp, theme.candleUp);
  copyColor(candleCfg.colorDown, theme.candleDown);
  auto candles = std::make_unique<CandleRecipe>(kCandleIdBase, candleCfg);
  CandleData candleData = candles->computeCandles(scales, bars);
  const CandleRecipe* candlePtr = candles.get();
  ok = ok && mount(std::move(candles));
  ok = ok && uploadFloats(candlePtr->wickUpBufferId(), candlePtr->wickUpGeometryId(),
                          candleData.wickUp, candleData.upCount * 2);
  ok = ok && uploadFloats(candlePtr->wickDownBufferId(), candlePtr->wickDownGeometryId(),
                          candleData.wickDown, candleData.downCount * 2);
  ok = ok && uploadFloats(candlePtr->bodyUpBufferId(), candlePtr->bodyUpGeometryId(),
                          candleData.bodyUp, candleData.upCount);
  ok = ok && uploadFloats(candlePtr->bodyDownBufferId(), candlePtr->bodyDownGeometryId(),
                          candleData.bodyDown, candleData.downCount);

  // Volume
  VolumeRecipeConfig volCfg;
  volCfg.layerId = kVolumeLayerId;
  copyColor(volCfg.colorUp, theme.volumeUp);
  copyColor(volCfg.colorDown, theme.volumeDown);
  auto volume = std::make_unique<VolumeRecipe>(kVolumeIdBase, volCfg);
  VolumeBarData volData = volume->computeVolumeBars(scales, bars);
  const VolumeRecipe* volPtr = volume.get();
  ok = ok && mount(std::move(volume));
  ok = ok && uploadFloats(volPtr->upBufferId(), volPtr->upGeometryId(),
                          volData.barsUp, volData.upCount);
  ok = ok && uploadFloats(volPtr->downBufferId(), volPtr->downGeometryId(),
                          volData.barsDown, volData.downCount);

  // Moving-average overlays, one per configured window.
  const MaWindows& windows = series.maWindows();
  for (std::size_t k = 0; k < windows.size() && ok; k++) {
    MaOverlayConfig maCfg;
    maCfg.layerId = kOverlayLayerId;
    maCfg.name = "ma" + std::to_string(windows[k]);
    maCfg.windowIndex = k;
    maCfg.source = MaSource::Price;
    copyColor(maCfg.color, overlayColor(theme, k));
    maCfg.lineWidth = theme.overlayLineWidth;
    auto ma = std::make_unique<MaOverlayRecipe>(maIdBase(k), maCfg);
    MaOverlayData maData = ma->computeOverlay(scales, bars);
    const MaOverlayRecipe* maPtr = ma.get();
    ok = ok && mount(std::move(ma));
    ok = ok && uploadFloats(maPtr->bufferId(), maPtr->geometryId(),
                            maData.segments, maData.vertexCount);

    if (!config_.drawVolumeMa) continue;

    MaOverlayConfig vmaCfg = maCfg;
    vmaCfg.name = "vol_ma" + std::to_string(windows[k]);
    vmaCfg.source = MaSource::Volume;
    vmaCfg.color[3] = theme.volumeOverlayAlpha;
    auto vma = std::make_unique<MaOverlayRecipe>(volumeMaIdBase(k), vmaCfg);
    MaOverlayData vmaData = vma->computeOverlay(scales, bars);
    const MaOverlayRecipe* vmaPtr = vma.get();
    ok = ok && mount(std::move(vma));
    ok = ok && uploadFloats(vmaPtr->bufferId(), vmaPtr->geometryId(),
                            vmaData.segments, vmaData.vertexCount);
  }

  // Crosshair starts hidden.
  CrosshairRecipeConfig crossCfg;
  crossCfg.layerId = kCrosshairLayerId;
  copyColor(crossCfg.color, theme.crosshairColor);
  crossCfg.dashOn = theme.crosshairDash[0];
  crossCfg.dashOff = theme.crosshairDash[1];
  auto crosshair = std::make_unique<CrosshairRecipe>(kCrosshairIdBase, crossCfg);
  const CrosshairRecipe* crossPtr = crosshair.get();
  ok = ok && mount(std::move(crosshair));
  if (ok) crosshair_ = crossPtr;
  ok = ok && uploadFloats(crossPtr->bufferId(), crossPtr->geometryId(), {}, 0);

  if (canvas_->commands.inFrame()) ok = commitFrame() && ok;

  layout_ = scales.layout;
  viewport_ = viewport;
  placeholder_.clear();
  redrawCount_++;
  if (!ok) {
    std::fprintf(stderr, "ChartRenderer: redraw of series version %llu incomplete\n",
                 static_cast<unsigned long long>(seriesVersion));
    renderedVersion_.reset();
    return false;
  }
  renderedVersion_ = seriesVersion;
  present();
  return true;
}

bool ChartRenderer::renderPlaceholder(const std::string& text, const ChartViewport& viewport) {
  if (!canvas_) {
    std::fprintf(stderr, "ChartRenderer: placeholder without an acquired canvas\n");
    return false;
  }

  bool ok = beginFrame();
  ok = teardown() && ok;
  ok = ok && createLayers();

  MessageRecipeConfig msgCfg;
  msgCfg.layerId = kMessageLayerId;
  copyColor(msgCfg.color, config_.theme.labelColor);
  auto msg = std::make_unique<MessageRecipe>(kMessageIdBase, msgCfg);
  std::vector<TextLabel> labels = msg->computeMessage(text, viewport);
  const MessageRecipe* msgPtr = msg.get();
  ok = ok && mount(std::move(msg));
  ok = ok && uploadLabels(msgPtr->bufferId(), msgPtr->geometryId(), std::move(labels));

  if (canvas_->commands.inFrame()) ok = commitFrame() && ok;

  viewport_ = viewport;
  placeholder_ = text;
  renderedVersion_.reset();
  redrawCount_++;
  if (ok) present();
  return ok;
}

bool ChartRenderer::clear() {
  if (!canvas_) return false;
  bool ok = beginFrame();
  ok = teardown() && ok;
  if (canvas_->commands.inFrame()) ok = commitFrame() && ok;
  placeholder_.clear();
  renderedVersion_.reset();
  if (ok) present();
  return ok;
}

bool ChartRenderer::updateCrosshair(std::optional<double> x) {
  if (!canvas_ || !crosshair_) return false;

  CrosshairData data = crosshair_->computeCrosshair(x, layout_);
  bool ok = beginFrame();
  ok = ok && uploadFloats(crosshair_->bufferId(), crosshair_->geometryId(),
                          data.segments, data.vertexCount);
  if (canvas_->commands.inFrame()) ok = commitFrame() && ok;
  if (ok) present();
  return ok;
}

std::vector<Id> ChartRenderer::mountedDrawItemIds() const {
  std::vector<Id> ids;
  for (const auto& m : mounted_) {
    auto d = m.recipe->drawItemIds();
    ids.insert(ids.end(), d.begin(), d.end());
  }
  return ids;
}

} // namespace sl
