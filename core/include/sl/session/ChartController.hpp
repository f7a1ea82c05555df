#pragma once
#include "sl/data/BarSeries.hpp"
#include "sl/data/DataError.hpp"
#include "sl/data/MarketDataClient.hpp"
#include "sl/data/NewsIndex.hpp"
#include "sl/events/EventStream.hpp"
#include "sl/interaction/InteractionController.hpp"
#include "sl/layout/Scales.hpp"
#include "sl/loop/TaskQueue.hpp"
#include "sl/news/NewsResolver.hpp"
#include "sl/render/ChartRenderer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sl {

enum class ChartState : std::uint8_t {
  Idle,       // no series loaded
  Loading,    // fetch in flight
  Ready,      // series present and rendered
  Redrawing,  // transient, always returns to Ready
  Disposed    // terminal
};

const char* toString(ChartState s);

struct ChartStatus {
  ChartState state{ChartState::Idle};
  std::string ticker;
  std::string period;
  std::optional<DataError> error;  // set on Idle after a failed load
  bool noData{false};              // Ready with an empty series
  std::uint64_t seriesVersion{0};
};

struct ChartControllerConfig {
  MaWindows maWindows{defaultMaWindows()};
  ChartViewport viewport;
  double volumeFraction{kDefaultVolumeFraction};
  ChartRendererConfig renderer;
  std::string noDataText{"No data"};
};

// Drives load -> render -> interactive -> redraw -> dispose. All methods run
// on the UI thread; fetch completions and redraws arrive through the queue.
class ChartController {
public:
  ChartController(TaskQueue& queue, MarketDataClient& client,
                  const ChartControllerConfig& config = {});
  ~ChartController();

  ChartController(const ChartController&) = delete;
  ChartController& operator=(const ChartController&) = delete;

  // Starts a fetch. Responses to earlier loads are ignored from here on.
  void load(const std::string& ticker, const std::string& period);

  // Records the new size. Only a width change redraws.
  void resize(double width, double height);

  void pointerMove(double x, double y);
  void pointerLeave();
  void click(double x, double y);

  // Releases the canvas, drops listeners and state. Terminal.
  void dispose();

  void setPresenter(FramePresenter* presenter) { renderer_.setPresenter(presenter); }

  ChartState state() const { return status_.state; }
  const ChartStatus& status() const { return status_; }
  bool disposed() const { return status_.state == ChartState::Disposed; }

  EventStream<ChartStatus>& statusEvents() { return statusEvents_; }
  EventStream<const Bar*>& hoverEvents() { return interaction_.hoverEvents(); }
  EventStream<DayKey>& dateSelections() { return interaction_.dateSelections(); }

  const BarSeriesStore& store() const { return store_; }
  const std::shared_ptr<const NewsIndex>& newsIndex() const { return newsIndex_; }
  const ChartViewport& viewport() const { return viewport_; }
  const std::optional<Scales>& scales() const { return scales_; }
  const InteractionController& interaction() const { return interaction_; }
  const NewsResolver& news() const { return news_; }
  NewsResolver& news() { return news_; }
  const ChartRenderer& renderer() const { return renderer_; }

  std::uint64_t fetchGeneration() const { return fetchGeneration_; }
  std::uint64_t staleResponseCount() const { return staleResponses_; }
  bool redrawPending() const { return redrawScheduled_; }

private:
  void onBars(std::uint64_t generation, BarsResponse response);
  void failLoad(const DataError& err);
  void recomputeScales();
  void scheduleRedraw();
  void performRedraw();
  void setState(ChartState s);
  void publishStatus();

  TaskQueue& queue_;
  MarketDataClient& client_;
  ChartControllerConfig config_;

  ChartViewport viewport_;
  BarSeriesStore store_;
  std::shared_ptr<const NewsIndex> newsIndex_;
  std::optional<Scales> scales_;

  InteractionController interaction_;
  NewsResolver news_;
  ChartRenderer renderer_;

  ChartStatus status_;
  EventStream<ChartStatus> statusEvents_;
  EventStream<const Bar*>::Subscription hoverSub_;
  EventStream<DayKey>::Subscription selectSub_;

  std::uint64_t fetchGeneration_{0};
  std::uint64_t staleResponses_{0};
  bool awaitingFirstRender_{false};
  bool redrawDirty_{false};
  bool redrawScheduled_{false};

  std::shared_ptr<bool> alive_;
};

} // namespace sl
