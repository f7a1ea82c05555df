#pragma once
#include "sl/data/Bar.hpp"
#include "sl/layout/ChartViewport.hpp"

#include <string>

namespace sl {

// Application settings for the chart viewer and snapshot tools.
struct ChartConfig {
  std::string apiBaseUrl{"http://127.0.0.1:8000"};
  std::string ticker{"AAPL"};
  std::string period{"6mo"};
  MaWindows maWindows{defaultMaWindows()};
  ChartViewport viewport;
  double volumeFraction{kDefaultVolumeFraction};
  std::string theme{"dark"};
};

std::string serializeChartConfig(const ChartConfig& config);

// Fields present in `json` override those in `out`; unknown fields are
// ignored. Returns false (with `error` set) on a parse error or a field of
// the wrong type or range; `out` is left untouched in that case.
bool loadChartConfig(const std::string& json, ChartConfig& out, std::string& error);

// Reads the whole file and calls loadChartConfig().
bool loadChartConfigFile(const std::string& path, ChartConfig& out, std::string& error);

} // namespace sl
