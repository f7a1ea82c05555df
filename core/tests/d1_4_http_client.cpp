// D1.4 - HTTP market data client
// Tests: base URL parsing, query encoding, an invalid client fails through
// the queue, an unreachable backend reports FETCH_FAILED, stop() completes
// queued requests.

#include "sl/data/HttpMarketDataClient.hpp"
#include "sl/loop/TaskQueue.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Pumps the queue until `done` or about five seconds pass.
template <typename Pred>
static bool pumpUntil(sl::TaskQueue& q, Pred done) {
  for (int i = 0; i < 500 && !done(); i++) {
    q.runPending();
    if (!done()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return done();
}

int main() {
  // ---- Test 1: base URL ----
  {
    sl::HttpEndpoint ep;
    requireTrue(sl::parseHttpBaseUrl("http://127.0.0.1:8000", ep), "host and port");
    requireTrue(ep.host == "127.0.0.1" && ep.port == "8000" && ep.basePath.empty(), "fields");

    requireTrue(sl::parseHttpBaseUrl("http://charts.local/backend/", ep), "path, default port");
    requireTrue(ep.host == "charts.local" && ep.port == "80", "default port");
    requireTrue(ep.basePath == "/backend", "trailing slash trimmed");

    requireTrue(!sl::parseHttpBaseUrl("https://charts.local", ep), "https unsupported");
    requireTrue(!sl::parseHttpBaseUrl("charts.local:80", ep), "scheme required");
    requireTrue(!sl::parseHttpBaseUrl("http://:80", ep), "host required");
    requireTrue(!sl::parseHttpBaseUrl("http://host:8a", ep), "numeric port");
    requireTrue(!sl::parseHttpBaseUrl("http://host:", ep), "empty port");

    std::printf("  Test 1 (base url) PASS\n");
  }

  // ---- Test 2: query encoding ----
  {
    requireTrue(sl::urlEncode("AAPL") == "AAPL", "plain ticker");
    requireTrue(sl::urlEncode("BRK.B") == "BRK.B", "dot kept");
    requireTrue(sl::urlEncode("^GSPC") == "%5EGSPC", "caret escaped");
    requireTrue(sl::urlEncode("a b&c") == "a%20b%26c", "space and ampersand");

    std::printf("  Test 2 (encoding) PASS\n");
  }

  // ---- Test 3: invalid client ----
  {
    sl::TaskQueue q;
    sl::HttpMarketDataClient client(q, "ftp://nowhere", sl::defaultMaWindows());
    requireTrue(!client.valid(), "invalid base url");

    bool called = false;
    client.fetchBars("AAPL", "6mo", [&](sl::BarsResponse r) {
      called = true;
      requireTrue(!r.ok && r.err.code == "FETCH_FAILED", "fetch failed");
    });
    requireTrue(!called, "never completes re-entrantly");
    q.runPending();
    requireTrue(called, "completion delivered as a task");

    std::printf("  Test 3 (invalid client) PASS\n");
  }

  // ---- Test 4: unreachable backend ----
  {
    sl::TaskQueue q;
    sl::HttpMarketDataClient client(q, "http://127.0.0.1:1", sl::defaultMaWindows(), 2);
    requireTrue(client.valid(), "valid base url");

    bool barsDone = false;
    bool newsDone = false;
    client.fetchBars("AAPL", "6mo", [&](sl::BarsResponse r) {
      barsDone = true;
      requireTrue(!r.ok && r.err.code == "FETCH_FAILED", "bars fetch failed");
    });
    client.fetchNewsByDate("AAPL", "2024-01-02", [&](sl::NewsResponse r) {
      newsDone = true;
      requireTrue(!r.ok && r.err.code == "FETCH_FAILED", "news fetch failed");
    });
    requireTrue(pumpUntil(q, [&] { return barsDone && newsDone; }), "both completions arrive");

    client.stop();
    bool afterStop = false;
    client.fetchBars("AAPL", "6mo", [&](sl::BarsResponse r) {
      afterStop = !r.ok;
    });
    q.runPending();
    requireTrue(afterStop, "stopped client fails immediately");

    std::printf("  Test 4 (unreachable) PASS\n");
  }

  // ---- Test 5: stop with requests still queued ----
  {
    sl::TaskQueue q;
    sl::HttpMarketDataClient client(q, "http://127.0.0.1:1", sl::defaultMaWindows(), 2);

    constexpr int kRequests = 8;
    int failed = 0;
    int other = 0;
    for (int i = 0; i < kRequests; i++) {
      client.fetchBars("AAPL", "6mo", [&](sl::BarsResponse r) {
        if (!r.ok && r.err.code == "FETCH_FAILED") failed++; else other++;
      });
    }
    bool newsFailed = false;
    client.fetchNewsByDate("AAPL", "2024-01-02", [&](sl::NewsResponse r) {
      newsFailed = !r.ok && r.err.code == "FETCH_FAILED";
    });

    // Some requests may already have run; the rest are dropped by stop().
    client.stop();
    q.runPending();
    requireTrue(failed == kRequests && other == 0, "every queued bars request completes");
    requireTrue(newsFailed, "queued news request completes");

    q.runPending();
    requireTrue(failed == kRequests, "each completion delivered once");

    std::printf("  Test 5 (stop drains queue) PASS\n");
  }

  std::printf("D1.4 http_client: ALL PASS\n");
  return 0;
}
