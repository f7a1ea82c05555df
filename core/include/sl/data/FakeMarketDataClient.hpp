#pragma once
#include "sl/data/MarketDataClient.hpp"
#include "sl/loop/TaskQueue.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sl {

// In-memory collaborator: records every request and lets the caller
// complete them later, in any order. Completions are posted to the queue.
class FakeMarketDataClient : public MarketDataClient {
public:
  explicit FakeMarketDataClient(TaskQueue& queue);

  void fetchBars(const std::string& ticker, const std::string& period,
                 BarsCallback cb) override;
  void fetchNewsByDate(const std::string& ticker, const DayKey& date,
                       NewsCallback cb) override;

  struct BarsRequest {
    std::string ticker;
    std::string period;
    BarsCallback cb;
    bool completed{false};
  };
  struct NewsRequest {
    std::string ticker;
    DayKey date;
    NewsCallback cb;
    bool completed{false};
  };

  std::size_t barsRequestCount() const { return barsRequests_.size(); }
  std::size_t newsRequestCount() const { return newsRequests_.size(); }
  const BarsRequest& barsRequest(std::size_t i) const { return barsRequests_.at(i); }
  const NewsRequest& newsRequest(std::size_t i) const { return newsRequests_.at(i); }

  // Each request can be completed once; returns false otherwise.
  bool completeBars(std::size_t i, std::vector<Bar> bars, std::vector<NewsItem> news = {});
  bool failBars(std::size_t i, const std::string& message);
  bool completeNews(std::size_t i, std::vector<NewsItem> news);
  bool failNews(std::size_t i, const std::string& message);

private:
  bool deliverBars(std::size_t i, BarsResponse resp);
  bool deliverNews(std::size_t i, NewsResponse resp);

  TaskQueue& queue_;
  std::vector<BarsRequest> barsRequests_;
  std::vector<NewsRequest> newsRequests_;
};

} // namespace sl
