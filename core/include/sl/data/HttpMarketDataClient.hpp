#pragma once
#include "sl/data/MarketDataClient.hpp"
#include "sl/loop/TaskQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sl {

struct HttpEndpoint {
  std::string host;
  std::string port{"80"};
  std::string basePath;  // no trailing slash
};

// Parses "http://host[:port][/path]". Returns false for other schemes.
bool parseHttpBaseUrl(const std::string& url, HttpEndpoint& out);

// Percent-encodes a query value (RFC 3986 unreserved set kept).
std::string urlEncode(const std::string& s);

struct HttpGetResult {
  bool ok{false};
  unsigned status{0};
  std::string body;
  std::string error;
};

// Blocking HTTP/1.1 GET. Transport errors and timeouts come back as
// ok=false with a message; no exceptions escape.
HttpGetResult httpGet(const HttpEndpoint& ep, const std::string& target, int timeoutSec);

// Talks to the chart backend:
//   GET <base>/api/ohlcv?ticker=&period=
//   GET <base>/api/news-by-date?ticker=&date=
// Requests run one at a time on a worker thread; completions are posted
// to the UI TaskQueue.
class HttpMarketDataClient : public MarketDataClient {
public:
  HttpMarketDataClient(TaskQueue& queue, const std::string& baseUrl,
                       MaWindows windows, int timeoutSec = 20);
  ~HttpMarketDataClient() override;

  HttpMarketDataClient(const HttpMarketDataClient&) = delete;
  HttpMarketDataClient& operator=(const HttpMarketDataClient&) = delete;

  void fetchBars(const std::string& ticker, const std::string& period,
                 BarsCallback cb) override;
  void fetchNewsByDate(const std::string& ticker, const DayKey& date,
                       NewsCallback cb) override;

  bool valid() const { return valid_; }
  // Joins the worker. Requests still queued complete with FETCH_FAILED
  // through the task queue; later requests fail the same way.
  void stop();

private:
  struct Job {
    std::function<void()> run;
    std::function<void()> cancel;  // posts a failed completion
  };

  void enqueue(Job job);
  void workerLoop();

  TaskQueue& queue_;
  HttpEndpoint endpoint_;
  MaWindows windows_;
  int timeoutSec_;
  bool valid_{false};

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  std::atomic<bool> running_{false};
  std::thread worker_;
};

} // namespace sl
