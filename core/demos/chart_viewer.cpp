// Interactive chart viewer
// GLFW window backed by the HTTP market-data client. Hover shows the
// readout, click resolves news for the day, keys 1-5 switch the period.
//
// usage: chart_viewer [config.json] [font.ttf]

#include "sl/config/ChartConfig.hpp"
#include "sl/data/HttpMarketDataClient.hpp"
#include "sl/interaction/Readout.hpp"
#include "sl/loop/TaskQueue.hpp"
#include "sl/session/ChartController.hpp"
#include "sl/style/Theme.hpp"

#ifdef SL_HAS_GLFW
#include "sl/gl/GlPresenter.hpp"
#include "sl/gl/GlfwContext.hpp"
#endif

#include <cstddef>
#include <cstdio>
#include <string>

int main(int argc, char** argv) {
  sl::ChartConfig config;
  if (argc > 1) {
    std::string err;
    if (!sl::loadChartConfigFile(argv[1], config, err)) {
      std::fprintf(stderr, "chart_viewer: config: %s\n", err.c_str());
      return 1;
    }
  }
  const std::string fontPath = argc > 2 ? argv[2] : "";

#ifdef SL_HAS_GLFW
  sl::GlfwContext ctx("StockLens - " + config.ticker);
  if (!ctx.init(static_cast<int>(config.viewport.width),
                static_cast<int>(config.viewport.height))) {
    return 1;
  }
  sl::GlPresenter presenter(ctx);
  if (!presenter.init(fontPath)) return 1;

  sl::TaskQueue queue;
  sl::HttpMarketDataClient client(queue, config.apiBaseUrl, config.maWindows);
  if (!client.valid()) {
    std::fprintf(stderr, "chart_viewer: unsupported api base url '%s'\n",
                 config.apiBaseUrl.c_str());
    return 1;
  }

  sl::ChartControllerConfig cc;
  cc.maWindows = config.maWindows;
  cc.viewport = config.viewport;
  cc.volumeFraction = config.volumeFraction;
  cc.renderer.theme = sl::themeByName(config.theme);

  sl::ChartController chart(queue, client, cc);
  chart.setPresenter(&presenter);

  auto statusSub = chart.statusEvents().subscribe([&](const sl::ChartStatus& s) {
    std::printf("[%s] %s %s", sl::toString(s.state), s.ticker.c_str(), s.period.c_str());
    if (s.error) std::printf(" error: %s", s.error->message.c_str());
    if (s.noData) std::printf(" (no data)");
    std::printf("\n");
  });

  auto hoverSub = chart.hoverEvents().subscribe([&](const sl::Bar* bar) {
    if (!bar) return;
    sl::Readout r = sl::makeReadout(*bar, config.maWindows);
    std::string title = "StockLens - " + config.ticker + "  " + r.date +
                        "  O " + r.open + "  H " + r.high + "  L " + r.low +
                        "  C " + r.close + "  V " + r.volume + "  " + r.closeChange;
    ctx.setTitle(title);
  });

  auto newsSub = chart.news().updates().subscribe([](const sl::NewsPanelState& s) {
    if (!s.date) return;
    if (s.loading()) {
      std::printf("news %s: loading...\n", s.date->c_str());
      return;
    }
    if (s.noNewsFound()) {
      std::printf("news %s: no news found\n", s.date->c_str());
      return;
    }
    for (const auto& item : s.items) {
      std::printf("news %s [%s] %s\n", s.date->c_str(), item.source.c_str(), item.title.c_str());
    }
  });

  std::string period = config.period;
  chart.load(config.ticker, period);

  while (true) {
    sl::WindowInput in = ctx.pollInput();
    if (in.shouldClose) break;

    if (in.resized) {
      chart.resize(ctx.width(), ctx.height());
    }
    if (in.periodKey > 0) {
      const auto& periods = sl::validPeriods();
      const std::size_t idx = static_cast<std::size_t>(in.periodKey - 1);
      if (idx < periods.size() && periods[idx] != period) {
        period = periods[idx];
        chart.load(config.ticker, period);
      }
    }
    if (in.cursorLeft) {
      chart.pointerLeave();
    } else if (in.cursorMoved) {
      chart.pointerMove(in.cursorX, in.cursorY);
    }
    if (in.clicked) {
      chart.click(in.clickX, in.clickY);
    }

    queue.runPending();
  }

  chart.dispose();
  client.stop();
  return 0;
#else
  (void)fontPath;
  std::fprintf(stderr, "chart_viewer: built without GLFW\n");
  return 1;
#endif
}
