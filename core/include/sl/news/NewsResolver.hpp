#pragma once
#include "sl/data/MarketDataClient.hpp"
#include "sl/data/NewsIndex.hpp"
#include "sl/events/EventStream.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sl {

enum class NewsPanelKind : std::uint8_t {
  None,              // nothing selected
  FromIndex,         // served from the local index, no network
  FallbackPending,   // lookup in flight
  FallbackResolved,  // lookup returned (possibly empty)
  FallbackFailed     // lookup failed; shown as "no news found"
};

const char* toString(NewsPanelKind k);

struct NewsPanelState {
  NewsPanelKind kind{NewsPanelKind::None};
  std::optional<DayKey> date;
  std::vector<NewsItem> items;
  std::uint64_t generation{0};

  bool loading() const { return kind == NewsPanelKind::FallbackPending; }
  bool noNewsFound() const {
    return items.empty() && (kind == NewsPanelKind::FallbackResolved ||
                             kind == NewsPanelKind::FallbackFailed);
  }
};

// Resolves news for a selected day: the local index first, then a single
// lookup through the client. Every selection takes a new generation and
// completions for an older generation are dropped, so the last selection
// wins.
class NewsResolver {
public:
  explicit NewsResolver(MarketDataClient& client);
  ~NewsResolver();

  NewsResolver(const NewsResolver&) = delete;
  NewsResolver& operator=(const NewsResolver&) = delete;

  // Called on every series load. Clears the panel and orphans any
  // outstanding lookup.
  void setSource(const std::string& ticker, std::shared_ptr<const NewsIndex> index);
  void reset();

  void select(const DayKey& day);

  const NewsPanelState& state() const { return state_; }
  std::uint64_t generation() const { return generation_; }
  std::uint64_t fallbackRequestCount() const { return fallbackRequests_; }
  std::uint64_t staleResponseCount() const { return staleResponses_; }

  EventStream<NewsPanelState>& updates() { return updates_; }

private:
  void publish(NewsPanelState next);
  void onFallback(std::uint64_t generation, const DayKey& day, NewsResponse response);

  MarketDataClient& client_;
  std::string ticker_;
  std::shared_ptr<const NewsIndex> index_;

  NewsPanelState state_;
  std::uint64_t generation_{0};
  std::uint64_t fallbackRequests_{0};
  std::uint64_t staleResponses_{0};

  EventStream<NewsPanelState> updates_;
  std::shared_ptr<bool> alive_;
};

} // namespace sl
