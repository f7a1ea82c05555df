#include "sl/data/HttpMarketDataClient.hpp"
#include "sl/data/Payload.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>

namespace sl {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

bool parseHttpBaseUrl(const std::string& url, HttpEndpoint& out) {
  static const std::string kScheme = "http://";
  if (url.compare(0, kScheme.size(), kScheme) != 0) return false;

  std::string rest = url.substr(kScheme.size());
  std::string path;
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    path = rest.substr(slash);
    rest = rest.substr(0, slash);
  }
  while (!path.empty() && path.back() == '/') path.pop_back();

  HttpEndpoint ep;
  auto colon = rest.find(':');
  if (colon != std::string::npos) {
    ep.host = rest.substr(0, colon);
    ep.port = rest.substr(colon + 1);
    if (ep.port.empty()) return false;
    for (char c : ep.port) {
      if (c < '0' || c > '9') return false;
    }
  } else {
    ep.host = rest;
  }
  if (ep.host.empty()) return false;
  ep.basePath = path;
  out = ep;
  return true;
}

std::string urlEncode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                      c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

static HttpGetResult performGet(const HttpEndpoint& ep, const std::string& target,
                                int timeoutSec) {
  HttpGetResult r;
  net::io_context ioc;
  net::ip::tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::error_code ec;

  auto const results = resolver.resolve(ep.host, ep.port, ec);
  if (ec) {
    r.error = "DNS resolution error: " + ec.message();
    return r;
  }

  stream.expires_after(std::chrono::seconds(timeoutSec));
  stream.connect(results, ec);
  if (ec) {
    r.error = "connection error: " + ec.message();
    return r;
  }

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, ep.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::accept, "application/json");
  req.set(http::field::connection, "close");

  stream.expires_after(std::chrono::seconds(timeoutSec));
  http::write(stream, req, ec);
  if (ec) {
    r.error = "write error: " + ec.message();
    return r;
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  stream.expires_after(std::chrono::seconds(timeoutSec));
  http::read(stream, buffer, res, ec);
  if (ec) {
    r.error = "read error: " + ec.message();
    return r;
  }

  stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
  // not_connected is routine after Connection: close

  r.status = static_cast<unsigned>(res.result_int());
  r.body = std::move(res.body());
  if (r.status >= 400) {
    r.error = "HTTP status " + std::to_string(r.status);
    return r;
  }
  r.ok = true;
  return r;
}

HttpGetResult httpGet(const HttpEndpoint& ep, const std::string& target, int timeoutSec) {
  try {
    return performGet(ep, target, timeoutSec);
  } catch (const std::exception& e) {
    HttpGetResult r;
    r.error = e.what();
    return r;
  }
}

// -------------------- HttpMarketDataClient --------------------

HttpMarketDataClient::HttpMarketDataClient(TaskQueue& queue, const std::string& baseUrl,
                                           MaWindows windows, int timeoutSec)
  : queue_(queue), windows_(std::move(windows)), timeoutSec_(timeoutSec) {
  valid_ = parseHttpBaseUrl(baseUrl, endpoint_);
  if (!valid_) {
    std::fprintf(stderr, "HttpMarketDataClient: unsupported base URL '%s'\n", baseUrl.c_str());
    return;
  }
  running_.store(true);
  worker_ = std::thread(&HttpMarketDataClient::workerLoop, this);
}

HttpMarketDataClient::~HttpMarketDataClient() { stop(); }

void HttpMarketDataClient::stop() {
  std::deque<Job> dropped;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_.store(false);
    dropped.swap(jobs_);
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();

  for (Job& job : dropped) job.cancel();
}

void HttpMarketDataClient::enqueue(Job job) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_.load()) {
      jobs_.push_back(std::move(job));
      cv_.notify_one();
      return;
    }
  }
  job.cancel();
}

void HttpMarketDataClient::workerLoop() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !running_.load() || !jobs_.empty(); });
      if (!running_.load()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job.run();
  }
}

void HttpMarketDataClient::fetchBars(const std::string& ticker, const std::string& period,
                                     BarsCallback cb) {
  if (!valid_ || !running_.load()) {
    BarsResponse resp;
    resp.err = {"FETCH_FAILED", "HTTP client is not available"};
    queue_.post([cb, resp]() { if (cb) cb(resp); });
    return;
  }

  const std::string target = endpoint_.basePath + "/api/ohlcv?ticker=" + urlEncode(ticker) +
                             "&period=" + urlEncode(period);
  Job job;
  job.cancel = [this, cb]() {
    BarsResponse resp;
    resp.err = {"FETCH_FAILED", "request cancelled: client stopped"};
    queue_.post([cb, resp]() { if (cb) cb(resp); });
  };
  job.run = [this, target, cb]() {
    HttpGetResult got = httpGet(endpoint_, target, timeoutSec_);
    BarsResponse resp;
    if (!got.ok) {
      std::fprintf(stderr, "HttpMarketDataClient: GET %s failed: %s\n",
                   target.c_str(), got.error.c_str());
      resp.err = {"FETCH_FAILED", got.error};
    } else {
      BarsPayload p = parseBarsPayload(got.body, windows_);
      resp.ok = p.ok;
      resp.err = std::move(p.err);
      resp.bars = std::move(p.bars);
      resp.news = std::move(p.news);
    }
    queue_.post([cb, resp = std::move(resp)]() mutable {
      if (cb) cb(std::move(resp));
    });
  };
  enqueue(std::move(job));
}

void HttpMarketDataClient::fetchNewsByDate(const std::string& ticker, const DayKey& date,
                                           NewsCallback cb) {
  if (!valid_ || !running_.load()) {
    NewsResponse resp;
    resp.err = {"FETCH_FAILED", "HTTP client is not available"};
    queue_.post([cb, resp]() { if (cb) cb(resp); });
    return;
  }

  const std::string target = endpoint_.basePath + "/api/news-by-date?ticker=" +
                             urlEncode(ticker) + "&date=" + urlEncode(date);
  Job job;
  job.cancel = [this, cb]() {
    NewsResponse resp;
    resp.err = {"FETCH_FAILED", "request cancelled: client stopped"};
    queue_.post([cb, resp]() { if (cb) cb(resp); });
  };
  job.run = [this, target, cb]() {
    HttpGetResult got = httpGet(endpoint_, target, timeoutSec_);
    NewsResponse resp;
    if (!got.ok) {
      std::fprintf(stderr, "HttpMarketDataClient: GET %s failed: %s\n",
                   target.c_str(), got.error.c_str());
      resp.err = {"FETCH_FAILED", got.error};
    } else {
      NewsPayload p = parseNewsPayload(got.body);
      resp.ok = p.ok;
      resp.err = std::move(p.err);
      resp.news = std::move(p.news);
    }
    queue_.post([cb, resp = std::move(resp)]() mutable {
      if (cb) cb(std::move(resp));
    });
  };
  enqueue(std::move(job));
}

} // namespace sl
