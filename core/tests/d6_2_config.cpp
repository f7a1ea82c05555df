// D6.2 - Chart config
// Tests: defaults, partial override, serialize then load, invalid fields
// leave the config untouched, file loading.

#include "sl/config/ChartConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool rejects(const char* json, const char* what) {
  sl::ChartConfig cfg;
  std::string err;
  const bool ok = sl::loadChartConfig(json, cfg, err);
  if (ok || err.empty()) {
    std::fprintf(stderr, "expected rejection: %s\n", what);
    return false;
  }
  return cfg.ticker == "AAPL" && cfg.period == "6mo" && cfg.maWindows == sl::defaultMaWindows();
}

int main() {
  // ---- Test 1: defaults ----
  {
    sl::ChartConfig cfg;
    requireTrue(cfg.ticker == "AAPL" && cfg.period == "6mo", "default symbol and period");
    requireTrue(cfg.maWindows == sl::MaWindows({5, 20, 60, 120}), "default windows");
    requireTrue(cfg.viewport.width == 800 && cfg.viewport.height == 510, "default viewport");
    requireTrue(cfg.volumeFraction == sl::kDefaultVolumeFraction, "default volume fraction");

    std::string err;
    requireTrue(sl::loadChartConfig("{}", cfg, err), "empty object loads");
    requireTrue(cfg.ticker == "AAPL", "empty object keeps defaults");

    std::printf("  Test 1 (defaults) PASS\n");
  }

  // ---- Test 2: partial override ----
  {
    sl::ChartConfig cfg;
    std::string err;
    const char* json =
      "{\"ticker\":\"MSFT\",\"period\":\"1y\",\"maWindows\":[10,50],"
      "\"viewport\":{\"width\":1200,\"margins\":{\"left\":80}},"
      "\"theme\":\"light\",\"unknown\":true}";
    requireTrue(sl::loadChartConfig(json, cfg, err), "override loads");
    requireTrue(cfg.ticker == "MSFT" && cfg.period == "1y", "symbol and period");
    requireTrue(cfg.maWindows == sl::MaWindows({10, 50}), "windows replaced");
    requireTrue(cfg.viewport.width == 1200 && cfg.viewport.height == 510, "width only");
    requireTrue(cfg.viewport.margins.left == 80 && cfg.viewport.margins.right == 60, "left margin only");
    requireTrue(cfg.theme == "light", "theme");
    requireTrue(cfg.apiBaseUrl == "http://127.0.0.1:8000", "base url kept");

    std::printf("  Test 2 (override) PASS\n");
  }

  // ---- Test 3: serialize then load ----
  {
    sl::ChartConfig a;
    a.ticker = "NVDA";
    a.period = "3mo";
    a.maWindows = {7};
    a.viewport.height = 640;
    a.volumeFraction = 0.3;

    sl::ChartConfig b;
    std::string err;
    requireTrue(sl::loadChartConfig(sl::serializeChartConfig(a), b, err), "reload");
    requireTrue(b.ticker == "NVDA" && b.period == "3mo", "strings survive");
    requireTrue(b.maWindows == sl::MaWindows({7}), "windows survive");
    requireTrue(b.viewport.height == 640 && b.volumeFraction == 0.3, "numbers survive");

    std::printf("  Test 3 (serialize) PASS\n");
  }

  // ---- Test 4: rejections ----
  {
    requireTrue(rejects("not json", "parse error"), "parse error");
    requireTrue(rejects("[1,2]", "array root"), "array root");
    requireTrue(rejects("{\"ticker\":5}", "numeric ticker"), "wrong type");
    requireTrue(rejects("{\"ticker\":\"MSFT\",\"period\":\"5d\"}", "bad period"), "bad period");
    requireTrue(rejects("{\"volumeFraction\":0.95}", "fraction too large"), "fraction range");
    requireTrue(rejects("{\"volumeFraction\":0}", "zero fraction"), "zero fraction");
    requireTrue(rejects("{\"maWindows\":[5,-1]}", "negative window"), "negative window");
    requireTrue(rejects("{\"maWindows\":[5.5]}", "fractional window"), "fractional window");
    requireTrue(rejects("{\"maWindows\":5}", "scalar windows"), "scalar windows");
    requireTrue(rejects("{\"viewport\":{\"width\":0}}", "zero width"), "zero width");
    requireTrue(rejects("{\"viewport\":{\"margins\":[]}}", "array margins"), "array margins");

    std::printf("  Test 4 (rejections) PASS\n");
  }

  // ---- Test 5: file loading ----
  {
    sl::ChartConfig cfg;
    std::string err;
    requireTrue(!sl::loadChartConfigFile("/nonexistent/stocklens.json", cfg, err), "missing file");
    requireTrue(err.find("cannot open") != std::string::npos, "missing file error");

    const char* path = "d6_2_config_test.json";
    std::FILE* f = std::fopen(path, "w");
    requireTrue(f != nullptr, "temp file");
    std::fputs("{\"ticker\":\"TSLA\"}", f);
    std::fclose(f);
    err.clear();
    requireTrue(sl::loadChartConfigFile(path, cfg, err), "file loads");
    requireTrue(cfg.ticker == "TSLA", "file contents applied");
    std::remove(path);

    std::printf("  Test 5 (file) PASS\n");
  }

  std::printf("D6.2 config: ALL PASS\n");
  return 0;
}
