#pragma once
#include "sl/data/Bar.hpp"
#include "sl/data/DataError.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sl {

class BarSeries;

struct SeriesResult {
  bool ok{false};
  DataError err;
  std::size_t badIndex{0};
  std::shared_ptr<const BarSeries> series;
};

// Validates a single bar in isolation. Returns an empty code when valid.
DataError validateBar(const Bar& bar, std::size_t maCount);

// Checks strict ascending order with no duplicate keys.
// Returns an empty code when ordered; `badIndex` receives the offender.
DataError checkOrdering(const std::vector<Bar>& bars, std::size_t* badIndex = nullptr);

// Immutable, validated sequence of bars for one ticker/timeframe.
// Only constructible through create(); shared by const pointer.
class BarSeries {
  struct Key {
    explicit Key() = default;
  };

public:
  // Rejects the whole series if any bar is malformed or out of order.
  // An empty bar list is a valid (empty) series.
  static SeriesResult create(std::vector<Bar> bars, MaWindows windows);

  // Callable from create() only; Key is private.
  BarSeries(Key, std::vector<Bar> bars, MaWindows windows);

  std::size_t size() const { return bars_.size(); }
  bool empty() const { return bars_.empty(); }
  const Bar& operator[](std::size_t i) const { return bars_[i]; }
  const std::vector<Bar>& bars() const { return bars_; }
  const MaWindows& maWindows() const { return windows_; }

  std::optional<std::size_t> indexOf(const DayKey& key) const;
  const Bar* find(const DayKey& key) const;

  double minLow() const { return minLow_; }
  double maxHigh() const { return maxHigh_; }
  double maxVolume() const { return maxVolume_; }

private:
  std::vector<Bar> bars_;
  MaWindows windows_;
  double minLow_{0};
  double maxHigh_{0};
  double maxVolume_{0};
};

// Holds the active series. Each replacement bumps a monotonically
// increasing version; consumers compare versions instead of contents.
class BarSeriesStore {
public:
  std::uint64_t replace(std::shared_ptr<const BarSeries> series);
  void clear();

  const std::shared_ptr<const BarSeries>& current() const { return series_; }
  bool hasSeries() const { return series_ != nullptr; }
  std::uint64_t version() const { return version_; }

private:
  std::shared_ptr<const BarSeries> series_;
  std::uint64_t version_{0};
};

} // namespace sl
