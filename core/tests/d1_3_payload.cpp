// D1.3 - Payload decoding
// Tests: bars payload fields and MA windows, "bars" alias, success=false,
// invalid JSON, malformed bar entries, news-by-date payload.

#include "sl/data/Payload.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: full bars payload ----
  {
    const std::string json = R"({
      "success": true, "ticker": "AAPL", "period": "6mo",
      "data": [
        {"time": "2024-01-02T00:00:00", "open": 100, "high": 105, "low": 99, "close": 104,
         "volume": 1000000, "ma5": null, "ma20": 101.5, "vol_ma5": 900000,
         "close_change_pct": 1.25},
        {"time": "2024-01-03", "open": 104, "high": 106, "low": 100, "close": 101,
         "volume": 1200000, "ma5": 102.0, "volume_change_pct": -3.5}
      ],
      "news": [
        {"title": "Earnings", "summary": "Beat", "url": "https://example.com/a",
         "source": "Wire", "pubDate": "2024-01-02T08:00:00Z"},
        {"title": "No link", "summary": "", "url": "", "source": "Wire", "pubDate": "2024-01-03"}
      ]
    })";

    sl::BarsPayload p = sl::parseBarsPayload(json, {5, 20});
    requireTrue(p.ok, "payload ok");
    requireTrue(p.ticker == "AAPL" && p.period == "6mo", "ticker + period");
    requireTrue(p.bars.size() == 2, "two bars");

    const sl::Bar& b0 = p.bars[0];
    requireTrue(b0.time == "2024-01-02", "time truncated to day");
    requireTrue(b0.open == 100 && b0.high == 105 && b0.low == 99 && b0.close == 104, "OHLC");
    requireTrue(b0.volume == 1000000, "volume");
    requireTrue(b0.ma.size() == 2 && b0.volMa.size() == 2, "one MA slot per window");
    requireTrue(!b0.ma[0].has_value(), "null ma5 -> nullopt");
    requireTrue(b0.ma[1].has_value() && *b0.ma[1] == 101.5, "ma20 read");
    requireTrue(b0.volMa[0].has_value() && *b0.volMa[0] == 900000, "vol_ma5 read");
    requireTrue(!b0.volMa[1].has_value(), "absent vol_ma20 -> nullopt");
    requireTrue(b0.closeChangePct.has_value() && *b0.closeChangePct == 1.25, "close change");
    requireTrue(!b0.volumeChangePct.has_value(), "absent volume change");
    requireTrue(p.bars[1].volumeChangePct.has_value() && *p.bars[1].volumeChangePct == -3.5,
                "volume change");

    requireTrue(p.news.size() == 2, "two news items");
    requireTrue(p.news[0].url.has_value() && *p.news[0].url == "https://example.com/a", "url kept");
    requireTrue(!p.news[1].url.has_value(), "empty url -> nullopt");
    requireTrue(p.news[0].pubDate == "2024-01-02T08:00:00Z", "pubDate kept raw");

    std::printf("  Test 1 (bars payload) PASS\n");
  }

  // ---- Test 2: "bars" alias, null news ----
  {
    sl::BarsPayload p = sl::parseBarsPayload(
      R"({"bars":[{"time":"2024-01-02","open":1,"high":2,"low":1,"close":2,"volume":0}],"news":null})",
      {});
    requireTrue(p.ok && p.bars.size() == 1, "bars alias accepted");
    requireTrue(p.news.empty(), "null news is empty");
    requireTrue(p.bars[0].ma.empty(), "no windows -> no MA slots");

    std::printf("  Test 2 (bars alias) PASS\n");
  }

  // ---- Test 3: failures ----
  {
    sl::BarsPayload p = sl::parseBarsPayload(R"({"success":false,"error":"unknown ticker"})", {});
    requireTrue(!p.ok && p.err.code == "FETCH_FAILED", "success=false -> FETCH_FAILED");
    requireTrue(p.err.message == "unknown ticker", "error text carried");

    p = sl::parseBarsPayload("{not json", {});
    requireTrue(!p.ok && p.err.code == "BAD_PAYLOAD", "invalid JSON -> BAD_PAYLOAD");

    p = sl::parseBarsPayload("[1,2,3]", {});
    requireTrue(!p.ok && p.err.code == "BAD_PAYLOAD", "array root -> BAD_PAYLOAD");

    p = sl::parseBarsPayload(R"({"ticker":"X"})", {});
    requireTrue(!p.ok && p.err.code == "BAD_PAYLOAD", "missing data -> BAD_PAYLOAD");

    p = sl::parseBarsPayload(
      R"({"data":[{"time":"02/01/2024","open":1,"high":2,"low":1,"close":2,"volume":0}]})", {});
    requireTrue(!p.ok && p.err.code == "BAD_DAY_KEY", "bad time -> BAD_DAY_KEY");

    p = sl::parseBarsPayload(
      R"({"data":[{"time":"2024-01-02","open":"1","high":2,"low":1,"close":2,"volume":0}]})", {});
    requireTrue(!p.ok && p.err.code == "MALFORMED_BAR", "string price -> MALFORMED_BAR");

    std::printf("  Test 3 (failures) PASS\n");
  }

  // ---- Test 4: news-by-date payload ----
  {
    sl::NewsPayload p = sl::parseNewsPayload(
      R"({"success":true,"source":"search","news":[{"title":"T","summary":"S","source":"W","pubDate":"2024-01-05"}]})");
    requireTrue(p.ok, "news payload ok");
    requireTrue(p.source == "search", "source");
    requireTrue(p.news.size() == 1 && p.news[0].title == "T", "one item");

    p = sl::parseNewsPayload(R"({"success":true,"news":[]})");
    requireTrue(p.ok && p.news.empty(), "empty news ok");

    p = sl::parseNewsPayload(R"({"success":true})");
    requireTrue(!p.ok && p.err.code == "BAD_PAYLOAD", "missing news array");

    p = sl::parseNewsPayload(R"({"success":false,"error":"rate limited"})");
    requireTrue(!p.ok && p.err.code == "FETCH_FAILED", "failure flag");

    std::printf("  Test 4 (news payload) PASS\n");
  }

  std::printf("D1.3 payload: ALL PASS\n");
  return 0;
}
