// D7.1 - GL snapshot
// Renders a three-bar chart offscreen through the controller and checks
// background, candle body and volume bar pixels plus crosshair frames.

#include "sl/data/FakeMarketDataClient.hpp"
#include "sl/loop/TaskQueue.hpp"
#include "sl/session/ChartController.hpp"

#ifdef SL_HAS_OSMESA
#include "sl/gl/GlPresenter.hpp"
#include "sl/gl/OsMesaContext.hpp"
#endif

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

#ifdef SL_HAS_OSMESA
static sl::Bar makeBar(const char* day, double o, double h, double l, double c, double v) {
  sl::Bar b;
  b.time = day;
  b.open = o;
  b.high = h;
  b.low = l;
  b.close = c;
  b.volume = v;
  return b;
}

// Readback rows follow canvas y.
static const std::uint8_t* pixelAt(const std::vector<std::uint8_t>& px, int w,
                                   double x, double y) {
  const int ix = static_cast<int>(x);
  const int iy = static_cast<int>(y);
  return &px[(static_cast<std::size_t>(iy) * w + ix) * 4];
}

static bool near(std::uint8_t v, float f) {
  const int expected = static_cast<int>(f * 255.0f + 0.5f);
  return std::abs(static_cast<int>(v) - expected) <= 3;
}
#endif

int main() {
#ifndef SL_HAS_OSMESA
  std::printf("D7.1 gl_snapshot: SKIPPED (built without OSMesa)\n");
  return 0;
#else
  constexpr int W = 480, H = 320;

  sl::OsMesaContext ctx;
  if (!ctx.init(W, H)) {
    std::printf("D7.1 gl_snapshot: SKIPPED (OSMesa init failed)\n");
    return 0;
  }

  sl::GlPresenter presenter(ctx);
#ifdef FONT_PATH
  requireTrue(presenter.init(FONT_PATH), "presenter init");
  requireTrue(presenter.hasText(), "font loaded");
#else
  requireTrue(presenter.init(), "presenter init");
#endif

  sl::TaskQueue q;
  sl::FakeMarketDataClient client(q);
  sl::ChartControllerConfig cc;
  cc.viewport.width = W;
  cc.viewport.height = H;
  sl::ChartController chart(q, client, cc);
  chart.setPresenter(&presenter);

  chart.load("AAPL", "1mo");
  client.completeBars(0, {makeBar("2024-01-02", 100, 105, 99, 104, 1000),
                          makeBar("2024-01-03", 104, 106, 101, 102, 1500),
                          makeBar("2024-01-04", 102, 107, 101, 106, 1200)});
  q.drain();
  requireTrue(chart.state() == sl::ChartState::Ready, "chart ready");
  requireTrue(presenter.presentedFrames() == 1, "one frame");
  requireTrue(presenter.lastStats().drawCalls > 0, "draw calls issued");

  const sl::Theme theme = sl::darkTheme();
  const sl::Scales& s = *chart.scales();
  auto px = ctx.readPixels();
  requireTrue(px.size() == static_cast<std::size_t>(W) * H * 4, "readback size");

  // ---- Test 1: background ----
  {
    const std::uint8_t* p = pixelAt(px, W, 3, 3);
    requireTrue(near(p[0], theme.backgroundColor[0]) && near(p[1], theme.backgroundColor[1]) &&
                near(p[2], theme.backgroundColor[2]), "margin shows the background");
    std::printf("  Test 1 (background) PASS\n");
  }

  // ---- Test 2: candle bodies ----
  {
    const std::uint8_t* up = pixelAt(px, W, s.time.center(0), s.price(102.0));
    requireTrue(near(up[0], theme.candleUp[0]) && near(up[1], theme.candleUp[1]) &&
                near(up[2], theme.candleUp[2]), "up body is green");

    const std::uint8_t* down = pixelAt(px, W, s.time.center(1), s.price(103.0));
    requireTrue(near(down[0], theme.candleDown[0]) && near(down[1], theme.candleDown[1]) &&
                near(down[2], theme.candleDown[2]), "down body is red");
    std::printf("  Test 2 (candles) PASS\n");
  }

  // ---- Test 3: volume bars ----
  {
    // Volume bars are translucent: the red channel dominates for a down bar.
    const std::uint8_t* v = pixelAt(px, W, s.time.center(1), s.layout.volumeBottom - 2);
    requireTrue(v[0] > v[1] && v[0] > v[2], "down volume bar tinted red");
    std::printf("  Test 3 (volume) PASS\n");
  }

  // ---- Test 4: crosshair frame ----
  {
    chart.pointerMove(s.time.center(2), s.layout.plot.top + 10);
    requireTrue(presenter.presentedFrames() == 2, "hover presents a frame");
    requireTrue(chart.renderer().redrawCount() == 1, "hover is not a redraw");
    chart.pointerLeave();
    requireTrue(presenter.presentedFrames() == 3, "leave presents a frame");
    std::printf("  Test 4 (crosshair) PASS\n");
  }

  // ---- Test 5: wider surface ----
  {
    constexpr int W2 = 640;
    const double oldRight = s.layout.plot.right;
    requireTrue(ctx.resize(W2, H), "framebuffer resized");
    chart.resize(W2, H);
    q.drain();
    requireTrue(chart.renderer().redrawCount() == 2, "width change redraws");
    requireTrue(presenter.presentedFrames() == 4, "redraw presented");

    const sl::Scales& wide = *chart.scales();
    requireTrue(wide.layout.plot.right > oldRight, "plot widened");
    auto px2 = ctx.readPixels();
    requireTrue(px2.size() == static_cast<std::size_t>(W2) * H * 4, "readback follows size");
    const std::uint8_t* last = pixelAt(px2, W2, wide.time.center(2), wide.price(104.0));
    requireTrue(near(last[0], theme.candleUp[0]) && near(last[1], theme.candleUp[1]) &&
                near(last[2], theme.candleUp[2]), "last body drawn in the new layout");
    std::printf("  Test 5 (resize) PASS\n");
  }

  std::printf("D7.1 gl_snapshot: ALL PASS\n");
  return 0;
#endif
}
