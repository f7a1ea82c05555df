#include "sl/data/NewsIndex.hpp"

#include <utility>

namespace sl {

NewsIndex::NewsIndex(const std::vector<NewsItem>& items) {
  for (const NewsItem& item : items) {
    auto key = toDayKey(item.pubDate);
    if (!key) {
      dropped_++;
      continue;
    }
    NewsItem copy = item;
    copy.pubDate = *key;
    byDay_[*key].push_back(std::move(copy));
    itemCount_++;
  }
}

const std::vector<NewsItem>& NewsIndex::lookup(const DayKey& day) const {
  static const std::vector<NewsItem> kEmpty;
  auto it = byDay_.find(day);
  return it == byDay_.end() ? kEmpty : it->second;
}

bool NewsIndex::contains(const DayKey& day) const {
  return byDay_.find(day) != byDay_.end();
}

std::vector<DayKey> NewsIndex::days() const {
  std::vector<DayKey> out;
  out.reserve(byDay_.size());
  for (const auto& kv : byDay_) out.push_back(kv.first);
  return out;
}

} // namespace sl
