// D3.5 - Chart renderer
// Tests: acquire/release, full redraw mounts every layer, redraw replaces
// rather than accumulates, crosshair updates in place, placeholder and
// clear, presenter called once per committed frame.

#include "sl/data/BarSeries.hpp"
#include "sl/layout/Scales.hpp"
#include "sl/render/ChartRenderer.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

class CountingPresenter : public sl::FramePresenter {
public:
  bool present(const sl::Canvas& canvas, const sl::ChartViewport& viewport,
               const sl::Theme&) override {
    frames++;
    lastWidth = viewport.width;
    lastInFrame = canvas.commands.inFrame();
    return true;
  }
  int frames{0};
  double lastWidth{0};
  bool lastInFrame{false};
};

static sl::Bar makeBar(const char* day, double o, double h, double l, double c, double v,
                       std::optional<double> ma5, std::optional<double> ma20) {
  sl::Bar b;
  b.time = day;
  b.open = o;
  b.high = h;
  b.low = l;
  b.close = c;
  b.volume = v;
  b.ma = {ma5, ma20};
  b.volMa = {v, std::nullopt};
  return b;
}

int main() {
  const sl::MaWindows windows = {5, 20};
  auto series = sl::BarSeries::create({
    makeBar("2024-01-02", 100, 105, 99, 104, 1000, 101.0, std::nullopt),
    makeBar("2024-01-03", 104, 106, 101, 102, 1500, 102.0, std::nullopt),
    makeBar("2024-01-04", 102, 107, 101, 106, 1200, 103.5, std::nullopt),
  }, windows).series;
  requireTrue(series != nullptr, "series");
  sl::ChartViewport vp;
  sl::Scales scales = sl::computeScales(*series, vp).scales;

  // ---- Test 1: acquire ----
  {
    sl::ChartRenderer r;
    requireTrue(!r.isAcquired(), "starts released");
    requireTrue(!r.render(*series, scales, vp, 1), "render without canvas fails");
    requireTrue(r.acquire(), "acquire");
    requireTrue(!r.acquire(), "second acquire refused");
    r.release();
    requireTrue(!r.isAcquired() && r.canvas() == nullptr, "released");

    std::printf("  Test 1 (acquire) PASS\n");
  }

  // ---- Test 2: full redraw ----
  {
    sl::ChartRenderer r;
    CountingPresenter presenter;
    r.setPresenter(&presenter);
    r.acquire();

    requireTrue(r.render(*series, scales, vp, 7), "render ok");
    requireTrue(r.redrawCount() == 1, "one redraw");
    requireTrue(r.renderedSeriesVersion() == std::optional<std::uint64_t>(7), "version recorded");
    requireTrue(presenter.frames == 1 && !presenter.lastInFrame, "presented after commit");

    const sl::Scene& scene = r.canvas()->scene;
    requireTrue(scene.paneIds().size() == 1, "one pane");
    requireTrue(scene.layerIds().size() == 8, "eight layers");
    requireTrue(scene.hasLayer(sl::kWickLayerId) && scene.hasLayer(sl::kBodyLayerId), "candle layers");

    // grid 1 + axes 3 + candles 4 + volume 2 + MA 2 + volume MA 2 + crosshair 1
    const auto mounted = r.mountedDrawItemIds();
    requireTrue(mounted.size() == 15, "fifteen draw items");
    requireTrue(scene.drawItemIds().size() == 15, "scene matches mounted set");

    // Each layer is above the previous one.
    const sl::DrawItem* wick = scene.getDrawItem(sl::kCandleIdBase + 2);
    const sl::DrawItem* body = scene.getDrawItem(sl::kCandleIdBase + 8);
    requireTrue(wick && body && wick->layerId < body->layerId, "wicks beneath bodies");

    // MA5 has three values -> drawn; MA20 has none -> empty.
    const sl::Geometry* ma5 = scene.getGeometry(sl::kMaIdBase + 1);
    const sl::Geometry* ma20 = scene.getGeometry(sl::maIdBase(1) + 1);
    requireTrue(ma5 && ma5->vertexCount > 0, "MA5 drawn");
    requireTrue(ma20 && ma20->vertexCount == 0, "MA20 empty");

    const sl::DrawItem* vma = scene.getDrawItem(sl::kVolumeMaIdBase + 2);
    requireTrue(vma && vma->color[3] < 1.0f, "volume MA translucent");

    const sl::Geometry* cross = scene.getGeometry(sl::kCrosshairIdBase + 1);
    requireTrue(cross && cross->vertexCount == 0, "crosshair starts hidden");

    const sl::Buffer* bodyBuf = scene.getBuffer(sl::kCandleIdBase + 6);
    requireTrue(bodyBuf && bodyBuf->byteLength == 2 * 16, "byte length synced for up bodies");

    std::printf("  Test 2 (full redraw) PASS\n");
  }

  // ---- Test 3: redraw replaces ----
  {
    sl::ChartRenderer r;
    r.acquire();
    r.render(*series, scales, vp, 1);
    const std::size_t items = r.canvas()->scene.drawItemIds().size();
    const std::size_t buffers = r.canvas()->buffers.bufferCount();

    sl::ChartViewport wide = vp;
    wide.width = 1000;
    sl::Scales wideScales = sl::computeScales(*series, wide).scales;
    requireTrue(r.render(*series, wideScales, wide, 2), "second render ok");
    requireTrue(r.redrawCount() == 2, "two redraws");
    requireTrue(r.canvas()->scene.drawItemIds().size() == items, "no accumulated items");
    requireTrue(r.canvas()->buffers.bufferCount() == buffers, "no accumulated buffers");
    requireTrue(r.canvas()->registry.size() ==
                1 + 8 + items * 3, "registry holds exactly the live graph");

    std::printf("  Test 3 (replace) PASS\n");
  }

  // ---- Test 4: crosshair in place ----
  {
    sl::ChartRenderer r;
    CountingPresenter presenter;
    r.setPresenter(&presenter);
    requireTrue(!r.updateCrosshair(100.0), "no crosshair before a render");
    r.acquire();
    r.render(*series, scales, vp, 1);

    requireTrue(r.updateCrosshair(scales.time.center(1)), "show crosshair");
    const sl::Geometry* cross = r.canvas()->scene.getGeometry(sl::kCrosshairIdBase + 1);
    requireTrue(cross->vertexCount > 0, "crosshair visible");
    auto pts = r.canvas()->buffers.floatsOf(sl::kCrosshairIdBase);
    requireTrue(!pts.empty() && pts[0] == static_cast<float>(scales.time.center(1)),
                "crosshair at band center");
    requireTrue(r.redrawCount() == 1, "crosshair is not a redraw");
    requireTrue(presenter.frames == 2, "crosshair frame presented");

    requireTrue(r.updateCrosshair(std::nullopt), "hide crosshair");
    requireTrue(r.canvas()->scene.getGeometry(sl::kCrosshairIdBase + 1)->vertexCount == 0,
                "crosshair hidden");

    std::printf("  Test 4 (crosshair) PASS\n");
  }

  // ---- Test 5: placeholder and clear ----
  {
    sl::ChartRenderer r;
    r.acquire();
    r.render(*series, scales, vp, 3);

    requireTrue(r.renderPlaceholder("No data", vp), "placeholder ok");
    requireTrue(r.placeholderText() == "No data", "placeholder text");
    requireTrue(!r.renderedSeriesVersion().has_value(), "no series rendered");
    requireTrue(r.redrawCount() == 2, "placeholder counts as a redraw");
    const sl::Scene& scene = r.canvas()->scene;
    requireTrue(scene.drawItemIds().size() == 1, "only the message");
    auto labels = r.canvas()->buffers.getLabels(sl::kMessageIdBase);
    requireTrue(labels && labels->size() == 1 && (*labels)[0].text == "No data", "message label");
    requireTrue(!r.updateCrosshair(100.0), "no crosshair on a placeholder");

    requireTrue(r.clear(), "clear ok");
    requireTrue(r.canvas()->scene.empty(), "scene empty after clear");
    requireTrue(r.canvas()->buffers.bufferCount() == 0, "buffers pruned");
    requireTrue(r.placeholderText().empty(), "placeholder cleared");

    std::printf("  Test 5 (placeholder + clear) PASS\n");
  }

  // ---- Test 6: volume MA toggle ----
  {
    sl::ChartRendererConfig cfg;
    cfg.drawVolumeMa = false;
    cfg.theme = sl::lightTheme();
    sl::ChartRenderer r(cfg);
    r.acquire();
    r.render(*series, scales, vp, 1);
    requireTrue(r.mountedDrawItemIds().size() == 13, "no volume MA items");
    requireTrue(!r.canvas()->scene.hasDrawItem(sl::kVolumeMaIdBase + 2), "volume MA absent");

    std::printf("  Test 6 (volume MA toggle) PASS\n");
  }

  std::printf("D3.5 render_pipeline: ALL PASS\n");
  return 0;
}
