#pragma once
#include "sl/data/Bar.hpp"
#include "sl/data/DataError.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sl {

struct BarsResponse {
  bool ok{false};
  DataError err;
  std::vector<Bar> bars;
  std::vector<NewsItem> news;
};

struct NewsResponse {
  bool ok{false};
  DataError err;
  std::vector<NewsItem> news;
};

// Timeframes accepted by the bars endpoint.
const std::vector<std::string>& validPeriods();
bool isValidPeriod(const std::string& period);

// External quote/news collaborator. Callbacks are always delivered on the
// UI thread as separate tasks, never re-entrantly from the fetch call.
class MarketDataClient {
public:
  using BarsCallback = std::function<void(BarsResponse)>;
  using NewsCallback = std::function<void(NewsResponse)>;

  virtual ~MarketDataClient() = default;

  virtual void fetchBars(const std::string& ticker, const std::string& period,
                         BarsCallback cb) = 0;
  virtual void fetchNewsByDate(const std::string& ticker, const DayKey& date,
                               NewsCallback cb) = 0;
};

} // namespace sl
