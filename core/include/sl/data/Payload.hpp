#pragma once
#include "sl/data/Bar.hpp"
#include "sl/data/DataError.hpp"

#include <string>
#include <vector>

namespace sl {

// Decoded `GET /api/ohlcv` response.
struct BarsPayload {
  bool ok{false};
  DataError err;
  std::string ticker;
  std::string period;
  std::vector<Bar> bars;
  std::vector<NewsItem> news;
};

// Decoded `GET /api/news-by-date` response.
struct NewsPayload {
  bool ok{false};
  DataError err;
  std::string source;
  std::vector<NewsItem> news;
};

// Bars come from a "data" or "bars" array. For each window N the fields
// "ma<N>" and "vol_ma<N>" are read (null or absent -> nullopt).
// `"success": false` turns into FETCH_FAILED carrying the "error" text.
BarsPayload parseBarsPayload(const std::string& json, const MaWindows& windows);

NewsPayload parseNewsPayload(const std::string& json);

} // namespace sl
