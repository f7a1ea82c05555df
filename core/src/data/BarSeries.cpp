#include "sl/data/BarSeries.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <utility>

namespace sl {

static bool finite(double v) { return std::isfinite(v); }

static bool finiteOrNull(const std::optional<double>& v) {
  return !v || std::isfinite(*v);
}

DataError validateBar(const Bar& bar, std::size_t maCount) {
  if (!isValidDayKey(bar.time)) {
    return {"BAD_DAY_KEY", "bar time is not a YYYY-MM-DD day: '" + bar.time + "'"};
  }
  if (!finite(bar.open) || !finite(bar.high) || !finite(bar.low) || !finite(bar.close)) {
    return {"MALFORMED_BAR", "non-finite price on " + bar.time};
  }
  if (bar.high < bar.low) {
    return {"MALFORMED_BAR", "high < low on " + bar.time};
  }
  if (bar.high < std::max(bar.open, bar.close)) {
    return {"MALFORMED_BAR", "high below open/close on " + bar.time};
  }
  if (bar.low > std::min(bar.open, bar.close)) {
    return {"MALFORMED_BAR", "low above open/close on " + bar.time};
  }
  if (!finite(bar.volume) || bar.volume < 0.0) {
    return {"MALFORMED_BAR", "negative or non-finite volume on " + bar.time};
  }
  if (bar.ma.size() != maCount || bar.volMa.size() != maCount) {
    return {"MALFORMED_BAR", "moving-average fields do not match the window set on " + bar.time};
  }
  for (std::size_t k = 0; k < maCount; k++) {
    if (!finiteOrNull(bar.ma[k]) || !finiteOrNull(bar.volMa[k])) {
      return {"MALFORMED_BAR", "non-finite moving average on " + bar.time};
    }
  }
  return {};
}

DataError checkOrdering(const std::vector<Bar>& bars, std::size_t* badIndex) {
  for (std::size_t i = 1; i < bars.size(); i++) {
    // Day keys compare lexicographically in calendar order.
    if (bars[i].time == bars[i - 1].time) {
      if (badIndex) *badIndex = i;
      return {"DUPLICATE_TIME", "duplicate bar time " + bars[i].time};
    }
    if (bars[i].time < bars[i - 1].time) {
      if (badIndex) *badIndex = i;
      return {"UNORDERED_SERIES",
              "bar " + bars[i].time + " follows " + bars[i - 1].time};
    }
  }
  return {};
}

SeriesResult BarSeries::create(std::vector<Bar> bars, MaWindows windows) {
  SeriesResult r;
  for (std::size_t i = 0; i < bars.size(); i++) {
    // Bars without moving-average data carry nulls for every window.
    if (bars[i].ma.empty()) bars[i].ma.resize(windows.size());
    if (bars[i].volMa.empty()) bars[i].volMa.resize(windows.size());
    DataError e = validateBar(bars[i], windows.size());
    if (!e.code.empty()) {
      r.err = std::move(e);
      r.badIndex = i;
      return r;
    }
  }

  DataError order = checkOrdering(bars, &r.badIndex);
  if (!order.code.empty()) {
    r.err = std::move(order);
    return r;
  }

  r.ok = true;
  r.series = std::make_shared<const BarSeries>(Key{}, std::move(bars), std::move(windows));
  return r;
}

BarSeries::BarSeries(Key, std::vector<Bar> bars, MaWindows windows)
  : bars_(std::move(bars)), windows_(std::move(windows)) {
  if (bars_.empty()) return;
  minLow_ = std::numeric_limits<double>::infinity();
  maxHigh_ = -std::numeric_limits<double>::infinity();
  for (const Bar& b : bars_) {
    minLow_ = std::min(minLow_, b.low);
    maxHigh_ = std::max(maxHigh_, b.high);
    maxVolume_ = std::max(maxVolume_, b.volume);
  }
}

std::optional<std::size_t> BarSeries::indexOf(const DayKey& key) const {
  auto it = std::lower_bound(bars_.begin(), bars_.end(), key,
                             [](const Bar& b, const DayKey& k) { return b.time < k; });
  if (it == bars_.end() || it->time != key) return std::nullopt;
  return static_cast<std::size_t>(it - bars_.begin());
}

const Bar* BarSeries::find(const DayKey& key) const {
  auto idx = indexOf(key);
  return idx ? &bars_[*idx] : nullptr;
}

std::uint64_t BarSeriesStore::replace(std::shared_ptr<const BarSeries> series) {
  series_ = std::move(series);
  return ++version_;
}

void BarSeriesStore::clear() {
  if (!series_) return;
  series_.reset();
  ++version_;
}

} // namespace sl
