// Offscreen chart snapshot
// Loads an /api/ohlcv payload from disk, runs it through the chart
// controller and writes the rendered frame as a PPM (OSMesa).
//
// usage: chart_snapshot <payload.json> <out.ppm> [config.json] [font.ttf]

#include "sl/config/ChartConfig.hpp"
#include "sl/data/FakeMarketDataClient.hpp"
#include "sl/data/Payload.hpp"
#include "sl/loop/TaskQueue.hpp"
#include "sl/session/ChartController.hpp"
#include "sl/style/Theme.hpp"

#ifdef SL_HAS_OSMESA
#include "sl/gl/GlPresenter.hpp"
#include "sl/gl/OsMesaContext.hpp"
#endif

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    std::fprintf(stderr, "usage: %s <payload.json> <out.ppm> [config.json] [font.ttf]\n", argv[0]);
    return 2;
  }
  const std::string payloadPath = argv[1];
  const std::string outPath = argv[2];

  sl::ChartConfig config;
  if (argc > 3) {
    std::string err;
    if (!sl::loadChartConfigFile(argv[3], config, err)) {
      std::fprintf(stderr, "chart_snapshot: config: %s\n", err.c_str());
      return 1;
    }
  }
  const std::string fontPath = argc > 4 ? argv[4] : "";

  std::string json;
  if (!readFile(payloadPath, json)) {
    std::fprintf(stderr, "chart_snapshot: cannot read %s\n", payloadPath.c_str());
    return 1;
  }
  sl::BarsPayload payload = sl::parseBarsPayload(json, config.maWindows);
  if (!payload.ok) {
    std::fprintf(stderr, "chart_snapshot: %s: %s\n",
                 payload.err.code.c_str(), payload.err.message.c_str());
    return 1;
  }

#ifdef SL_HAS_OSMESA
  const int w = static_cast<int>(config.viewport.width);
  const int h = static_cast<int>(config.viewport.height);

  sl::OsMesaContext ctx;
  if (!ctx.init(w, h)) {
    std::fprintf(stderr, "chart_snapshot: OSMesa init failed\n");
    return 1;
  }
  sl::GlPresenter presenter(ctx);
  if (!presenter.init(fontPath)) return 1;

  sl::TaskQueue queue;
  sl::FakeMarketDataClient client(queue);

  sl::ChartControllerConfig cc;
  cc.maWindows = config.maWindows;
  cc.viewport = config.viewport;
  cc.volumeFraction = config.volumeFraction;
  cc.renderer.theme = sl::themeByName(config.theme);

  sl::ChartController chart(queue, client, cc);
  chart.setPresenter(&presenter);

  const std::string ticker = payload.ticker.empty() ? config.ticker : payload.ticker;
  chart.load(ticker, payload.period.empty() ? config.period : payload.period);
  client.completeBars(0, std::move(payload.bars), std::move(payload.news));
  queue.drain();

  if (chart.state() != sl::ChartState::Ready) {
    std::fprintf(stderr, "chart_snapshot: chart not ready (%s)\n", sl::toString(chart.state()));
    return 1;
  }

  if (!sl::writePpm(outPath, ctx.readPixels(), w, h)) return 1;
  std::printf("chart_snapshot: %s %zu bars -> %s (%llu draw calls)\n",
              ticker.c_str(), chart.store().current()->size(), outPath.c_str(),
              static_cast<unsigned long long>(presenter.lastStats().drawCalls));
  return 0;
#else
  (void)fontPath;
  std::fprintf(stderr, "chart_snapshot: built without OSMesa\n");
  return 1;
#endif
}
