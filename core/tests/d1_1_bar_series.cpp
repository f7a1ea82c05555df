// D1.1 - Bar series validation and store versioning
// Tests: day keys, per-bar invariants, ordering, empty series, MA padding,
// store replace/clear versions.

#include "sl/data/Bar.hpp"
#include "sl/data/BarSeries.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

// Series are only built through create(), which validates.
static_assert(!std::is_constructible<sl::BarSeries, std::vector<sl::Bar>, sl::MaWindows>::value,
              "BarSeries has no unvalidated constructor");

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static sl::Bar makeBar(const std::string& day, double o, double h, double l, double c,
                       double v) {
  sl::Bar b;
  b.time = day;
  b.open = o;
  b.high = h;
  b.low = l;
  b.close = c;
  b.volume = v;
  return b;
}

int main() {
  // ---- Test 1: day keys ----
  {
    requireTrue(sl::isValidDayKey("2024-01-02"), "plain day is valid");
    requireTrue(!sl::isValidDayKey("2024-1-02"), "short month rejected");
    requireTrue(!sl::isValidDayKey("2024-13-01"), "month 13 rejected");
    requireTrue(!sl::isValidDayKey("2024-02-30"), "Feb 30 rejected");
    requireTrue(sl::isValidDayKey("2024-02-29"), "leap day accepted");
    requireTrue(!sl::isValidDayKey("2023-02-29"), "non-leap Feb 29 rejected");

    auto k = sl::toDayKey("2024-01-02T00:00:00");
    requireTrue(k.has_value() && *k == "2024-01-02", "timestamp truncates to day");
    k = sl::toDayKey("2024-01-02 16:00:00");
    requireTrue(k.has_value() && *k == "2024-01-02", "space separator accepted");
    requireTrue(!sl::toDayKey("2024-01-02X").has_value(), "junk after the day rejected");
    requireTrue(!sl::toDayKey("Jan 2 2024").has_value(), "free text rejected");
    requireTrue(!sl::toDayKey("").has_value(), "empty string rejected");

    std::printf("  Test 1 (day keys) PASS\n");
  }

  // ---- Test 2: per-bar invariants ----
  {
    const std::size_t n = 0;
    requireTrue(sl::validateBar(makeBar("2024-01-02", 100, 105, 98, 104, 1e6), n).code.empty(),
                "well-formed bar passes");
    requireTrue(sl::validateBar(makeBar("2024-01-02", 100, 100, 100, 100, 0), n).code.empty(),
                "flat bar with zero volume passes");

    requireTrue(sl::validateBar(makeBar("2024-01-02", 100, 97, 98, 99, 1), n).code == "MALFORMED_BAR",
                "high below low rejected");
    requireTrue(sl::validateBar(makeBar("2024-01-02", 100, 103, 98, 104, 1), n).code == "MALFORMED_BAR",
                "high below close rejected");
    requireTrue(sl::validateBar(makeBar("2024-01-02", 97, 105, 98, 104, 1), n).code == "MALFORMED_BAR",
                "low above open rejected");
    requireTrue(sl::validateBar(makeBar("2024-01-02", 100, 105, 98, 104, -1), n).code == "MALFORMED_BAR",
                "negative volume rejected");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    requireTrue(sl::validateBar(makeBar("2024-01-02", nan, 105, 98, 104, 1), n).code == "MALFORMED_BAR",
                "NaN open rejected");
    requireTrue(sl::validateBar(makeBar("2024-01-2", 100, 105, 98, 104, 1), n).code == "BAD_DAY_KEY",
                "bad day key rejected");

    sl::Bar b = makeBar("2024-01-02", 100, 105, 98, 104, 1);
    b.ma = {101.0};
    requireTrue(sl::validateBar(b, 2).code == "MALFORMED_BAR", "MA count mismatch rejected");

    std::printf("  Test 2 (bar invariants) PASS\n");
  }

  // ---- Test 3: ordering ----
  {
    std::vector<sl::Bar> bars = {
      makeBar("2024-01-02", 100, 105, 98, 104, 1),
      makeBar("2024-01-03", 104, 106, 103, 105, 1),
      makeBar("2024-01-03", 104, 106, 103, 105, 1),
    };
    std::size_t bad = 0;
    requireTrue(sl::checkOrdering(bars, &bad).code == "DUPLICATE_TIME", "duplicate detected");
    requireTrue(bad == 2, "duplicate index reported");

    bars[2].time = "2024-01-01";
    requireTrue(sl::checkOrdering(bars, &bad).code == "UNORDERED_SERIES", "descending detected");
    requireTrue(bad == 2, "unordered index reported");

    bars[2].time = "2024-01-04";
    requireTrue(sl::checkOrdering(bars, &bad).code.empty(), "ascending accepted");

    std::printf("  Test 3 (ordering) PASS\n");
  }

  // ---- Test 4: create() rejects the whole series ----
  {
    std::vector<sl::Bar> bars = {
      makeBar("2024-01-02", 100, 105, 98, 104, 1),
      makeBar("2024-01-03", 104, 103, 106, 105, 1),  // high < low
    };
    sl::SeriesResult r = sl::BarSeries::create(bars, {});
    requireTrue(!r.ok, "malformed series rejected");
    requireTrue(r.err.code == "MALFORMED_BAR", "code is MALFORMED_BAR");
    requireTrue(r.badIndex == 1, "bad bar index reported");
    requireTrue(r.series == nullptr, "no series on failure");

    std::vector<sl::Bar> unordered = {
      makeBar("2024-01-03", 100, 105, 98, 104, 1),
      makeBar("2024-01-02", 104, 106, 103, 105, 1),
    };
    r = sl::BarSeries::create(unordered, {});
    requireTrue(!r.ok && r.err.code == "UNORDERED_SERIES", "unordered series rejected");

    r = sl::BarSeries::create({bars[0]}, {});
    requireTrue(r.ok && r.series && r.series.use_count() == 1, "valid series is solely owned");

    std::printf("  Test 4 (create rejects) PASS\n");
  }

  // ---- Test 5: empty series and extremes ----
  {
    sl::SeriesResult r = sl::BarSeries::create({}, sl::defaultMaWindows());
    requireTrue(r.ok && r.series && r.series->empty(), "empty series is valid");

    std::vector<sl::Bar> bars = {
      makeBar("2024-01-02", 100, 105, 99, 104, 1000),
      makeBar("2024-01-03", 104, 110, 99, 102, 1200),
    };
    r = sl::BarSeries::create(bars, sl::defaultMaWindows());
    requireTrue(r.ok, "valid series accepted");
    const sl::BarSeries& s = *r.series;
    requireTrue(s.size() == 2, "two bars");
    requireTrue(s.minLow() == 99.0, "minLow");
    requireTrue(s.maxHigh() == 110.0, "maxHigh");
    requireTrue(s.maxVolume() == 1200.0, "maxVolume");
    requireTrue(s[0].ma.size() == 4 && s[0].volMa.size() == 4, "missing MA padded to window count");
    requireTrue(!s[0].ma[0].has_value(), "padded MA is null");
    requireTrue(s.indexOf("2024-01-03") == std::optional<std::size_t>(1), "indexOf");
    requireTrue(!s.indexOf("2024-01-04").has_value(), "indexOf miss");
    requireTrue(s.find("2024-01-02") == &s[0], "find");
    requireTrue(s[0].isUp() && !s[1].isUp(), "direction");

    std::printf("  Test 5 (empty + extremes) PASS\n");
  }

  // ---- Test 6: store versions ----
  {
    sl::BarSeriesStore store;
    requireTrue(store.version() == 0 && !store.hasSeries(), "fresh store");

    store.clear();
    requireTrue(store.version() == 0, "clearing an empty store keeps the version");

    auto a = sl::BarSeries::create({makeBar("2024-01-02", 1, 2, 1, 2, 1)}, {}).series;
    auto b = sl::BarSeries::create({makeBar("2024-01-03", 1, 2, 1, 2, 1)}, {}).series;
    requireTrue(store.replace(a) == 1, "first replace -> 1");
    requireTrue(store.replace(b) == 2, "second replace -> 2");
    requireTrue(store.current() == b, "current is latest");
    requireTrue(store.replace(b) == 3, "same pointer still bumps");

    store.clear();
    requireTrue(!store.hasSeries() && store.version() == 4, "clear bumps once");

    std::printf("  Test 6 (store versions) PASS\n");
  }

  std::printf("D1.1 bar_series: ALL PASS\n");
  return 0;
}
