#include "sl/data/FakeMarketDataClient.hpp"

#include <utility>

namespace sl {

FakeMarketDataClient::FakeMarketDataClient(TaskQueue& queue) : queue_(queue) {}

void FakeMarketDataClient::fetchBars(const std::string& ticker, const std::string& period,
                                     BarsCallback cb) {
  barsRequests_.push_back({ticker, period, std::move(cb), false});
}

void FakeMarketDataClient::fetchNewsByDate(const std::string& ticker, const DayKey& date,
                                           NewsCallback cb) {
  newsRequests_.push_back({ticker, date, std::move(cb), false});
}

bool FakeMarketDataClient::deliverBars(std::size_t i, BarsResponse resp) {
  if (i >= barsRequests_.size() || barsRequests_[i].completed) return false;
  barsRequests_[i].completed = true;
  BarsCallback cb = barsRequests_[i].cb;
  queue_.post([cb, resp = std::move(resp)]() mutable {
    if (cb) cb(std::move(resp));
  });
  return true;
}

bool FakeMarketDataClient::deliverNews(std::size_t i, NewsResponse resp) {
  if (i >= newsRequests_.size() || newsRequests_[i].completed) return false;
  newsRequests_[i].completed = true;
  NewsCallback cb = newsRequests_[i].cb;
  queue_.post([cb, resp = std::move(resp)]() mutable {
    if (cb) cb(std::move(resp));
  });
  return true;
}

bool FakeMarketDataClient::completeBars(std::size_t i, std::vector<Bar> bars,
                                        std::vector<NewsItem> news) {
  BarsResponse resp;
  resp.ok = true;
  resp.bars = std::move(bars);
  resp.news = std::move(news);
  return deliverBars(i, std::move(resp));
}

bool FakeMarketDataClient::failBars(std::size_t i, const std::string& message) {
  BarsResponse resp;
  resp.err = {"FETCH_FAILED", message};
  return deliverBars(i, std::move(resp));
}

bool FakeMarketDataClient::completeNews(std::size_t i, std::vector<NewsItem> news) {
  NewsResponse resp;
  resp.ok = true;
  resp.news = std::move(news);
  return deliverNews(i, std::move(resp));
}

bool FakeMarketDataClient::failNews(std::size_t i, const std::string& message) {
  NewsResponse resp;
  resp.err = {"FETCH_FAILED", message};
  return deliverNews(i, std::move(resp));
}

} // namespace sl
