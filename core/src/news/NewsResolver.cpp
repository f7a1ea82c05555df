#include "sl/news/NewsResolver.hpp"
#include <cstdio>
#include <utility>

namespace sl {

const char* toString(NewsPanelKind k) {
  switch (k) {
    case NewsPanelKind::None: return "none";
    case NewsPanelKind::FromIndex: return "fromIndex";
    case NewsPanelKind::FallbackPending: return "pending";
    case NewsPanelKind::FallbackResolved: return "resolved";
    case NewsPanelKind::FallbackFailed: return "failed";
    default: return "unknown";
  }
}

NewsResolver::NewsResolver(MarketDataClient& client)
  : client_(client), alive_(std::make_shared<bool>(true)) {}

NewsResolver::~NewsResolver() {
  *alive_ = false;
}

void NewsResolver::publish(NewsPanelState next) {
  state_ = std::move(next);
  updates_.publish(state_);
}

void NewsResolver::setSource(const std::string& ticker,
                             std::shared_ptr<const NewsIndex> index) {
  ticker_ = ticker;
  index_ = std::move(index);
  reset();
}

void NewsResolver::reset() {
  ++generation_;
  NewsPanelState s;
  s.generation = generation_;
  publish(std::move(s));
}

void NewsResolver::select(const DayKey& day) {
  const std::uint64_t gen = ++generation_;

  NewsPanelState s;
  s.date = day;
  s.generation = gen;

  if (index_ && index_->contains(day)) {
    s.kind = NewsPanelKind::FromIndex;
    s.items = index_->lookup(day);
    publish(std::move(s));
    return;
  }

  s.kind = NewsPanelKind::FallbackPending;
  publish(std::move(s));

  fallbackRequests_++;
  std::weak_ptr<bool> alive = alive_;
  client_.fetchNewsByDate(ticker_, day, [this, alive, gen, day](NewsResponse response) {
    auto token = alive.lock();
    if (!token || !*token) return;
    onFallback(gen, day, std::move(response));
  });
}

void NewsResolver::onFallback(std::uint64_t generation, const DayKey& day,
                              NewsResponse response) {
  if (generation != generation_) {
    staleResponses_++;
    std::fprintf(stderr, "NewsResolver: dropping stale news for %s\n", day.c_str());
    return;
  }

  NewsPanelState s;
  s.date = day;
  s.generation = generation;
  if (response.ok) {
    s.kind = NewsPanelKind::FallbackResolved;
    s.items = std::move(response.news);
  } else {
    std::fprintf(stderr, "NewsResolver: news lookup for %s failed: %s\n",
                 day.c_str(), response.err.message.c_str());
    s.kind = NewsPanelKind::FallbackFailed;
  }
  publish(std::move(s));
}

} // namespace sl
