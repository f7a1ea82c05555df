#pragma once
#include "sl/data/Bar.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace sl {

// Day-bucketed news lookup, built once per series load and read-only after.
class NewsIndex {
public:
  NewsIndex() = default;

  // Items whose pubDate is not a day key (after truncation) are dropped.
  explicit NewsIndex(const std::vector<NewsItem>& items);

  // Items for `day`, in input order. Empty when none.
  const std::vector<NewsItem>& lookup(const DayKey& day) const;
  bool contains(const DayKey& day) const;

  std::size_t dayCount() const { return byDay_.size(); }
  std::size_t itemCount() const { return itemCount_; }
  std::size_t droppedCount() const { return dropped_; }

  std::vector<DayKey> days() const;

private:
  std::map<DayKey, std::vector<NewsItem>> byDay_;
  std::size_t itemCount_{0};
  std::size_t dropped_{0};
};

} // namespace sl
