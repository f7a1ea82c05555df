#include "sl/session/ChartController.hpp"

#include <cstdio>
#include <utility>

namespace sl {

const char* toString(ChartState s) {
  switch (s) {
    case ChartState::Idle: return "idle";
    case ChartState::Loading: return "loading";
    case ChartState::Ready: return "ready";
    case ChartState::Redrawing: return "redrawing";
    case ChartState::Disposed: return "disposed";
    default: return "unknown";
  }
}

ChartController::ChartController(TaskQueue& queue, MarketDataClient& client,
                                 const ChartControllerConfig& config)
  : queue_(queue),
    client_(client),
    config_(config),
    viewport_(config.viewport),
    news_(client),
    renderer_(config.renderer),
    alive_(std::make_shared<bool>(true)) {
  hoverSub_ = interaction_.hoverEvents().subscribe([this](const Bar*) {
    renderer_.updateCrosshair(interaction_.state().crosshairX);
  });
  selectSub_ = interaction_.dateSelections().subscribe([this](const DayKey& day) {
    news_.select(day);
  });
}

ChartController::~ChartController() {
  dispose();
}

void ChartController::setState(ChartState s) {
  status_.state = s;
  publishStatus();
}

void ChartController::publishStatus() {
  status_.seriesVersion = store_.version();
  statusEvents_.publish(status_);
}

void ChartController::load(const std::string& ticker, const std::string& period) {
  if (disposed()) {
    std::fprintf(stderr, "ChartController: load after dispose ignored\n");
    return;
  }

  const std::uint64_t gen = ++fetchGeneration_;
  status_.ticker = ticker;
  status_.period = period;
  status_.error.reset();
  status_.noData = false;

  if (!isValidPeriod(period)) {
    failLoad(DataError{"FETCH_FAILED", "unsupported period '" + period + "'"});
    return;
  }

  setState(ChartState::Loading);

  std::weak_ptr<bool> alive = alive_;
  client_.fetchBars(ticker, period, [this, alive, gen](BarsResponse response) {
    auto token = alive.lock();
    if (!token || !*token) return;
    onBars(gen, std::move(response));
  });
}

void ChartController::onBars(std::uint64_t generation, BarsResponse response) {
  if (disposed()) return;
  if (generation != fetchGeneration_) {
    staleResponses_++;
    std::fprintf(stderr, "ChartController: discarding stale response (generation %llu, current %llu)\n",
                 static_cast<unsigned long long>(generation),
                 static_cast<unsigned long long>(fetchGeneration_));
    return;
  }

  if (!response.ok) {
    std::fprintf(stderr, "ChartController: fetch failed: %s\n", response.err.message.c_str());
    failLoad(response.err);
    return;
  }

  SeriesResult sr = BarSeries::create(std::move(response.bars), config_.maWindows);
  if (!sr.ok) {
    std::fprintf(stderr, "ChartController: rejecting malformed series (%s at bar %zu): %s\n",
                 sr.err.code.c_str(), sr.badIndex, sr.err.message.c_str());
    failLoad(sr.err);
    return;
  }

  store_.replace(sr.series);
  newsIndex_ = std::make_shared<const NewsIndex>(response.news);
  if (newsIndex_->droppedCount() > 0) {
    std::fprintf(stderr, "ChartController: dropped %zu news items without a valid date\n",
                 newsIndex_->droppedCount());
  }
  news_.setSource(status_.ticker, newsIndex_);

  recomputeScales();
  interaction_.setSeries(store_.current(), scales_ ? &*scales_ : nullptr);

  awaitingFirstRender_ = true;
  scheduleRedraw();
}

void ChartController::failLoad(const DataError& err) {
  store_.clear();
  newsIndex_.reset();
  scales_.reset();
  interaction_.clearSeries();
  news_.setSource(status_.ticker, nullptr);
  if (renderer_.isAcquired()) renderer_.clear();

  awaitingFirstRender_ = false;
  redrawDirty_ = false;
  status_.error = err;
  status_.noData = false;
  setState(ChartState::Idle);
}

void ChartController::recomputeScales() {
  const auto& series = store_.current();
  if (!series || series->empty()) {
    scales_.reset();
    return;
  }
  ScalesResult r = computeScales(*series, viewport_, config_.volumeFraction);
  if (!r.ok) {
    std::fprintf(stderr, "ChartController: scales failed: %s\n", r.err.message.c_str());
    scales_.reset();
    return;
  }
  scales_ = r.scales;
}

void ChartController::resize(double width, double height) {
  if (disposed()) return;
  const bool widthChanged = width != viewport_.width;
  if (!widthChanged && height == viewport_.height) return;

  viewport_.width = width;
  viewport_.height = height;

  recomputeScales();
  if (scales_) {
    interaction_.relayout(*scales_);
    if (widthChanged) scheduleRedraw();
  } else if (widthChanged && store_.hasSeries()) {
    scheduleRedraw();  // placeholder is centered on the canvas
  }
}

void ChartController::scheduleRedraw() {
  redrawDirty_ = true;
  if (redrawScheduled_) return;
  redrawScheduled_ = true;

  std::weak_ptr<bool> alive = alive_;
  queue_.post([this, alive]() {
    auto token = alive.lock();
    if (!token || !*token) return;
    performRedraw();
  });
}

void ChartController::performRedraw() {
  redrawScheduled_ = false;
  if (disposed() || !redrawDirty_) return;
  redrawDirty_ = false;

  const auto& series = store_.current();
  if (!series) return;

  if (!renderer_.isAcquired()) renderer_.acquire();

  const bool fromReady = status_.state == ChartState::Ready;
  if (fromReady) setState(ChartState::Redrawing);

  bool ok = true;
  if (series->empty()) {
    ok = renderer_.renderPlaceholder(config_.noDataText, viewport_);
    status_.noData = true;
  } else if (scales_) {
    ok = renderer_.render(*series, *scales_, viewport_, store_.version());
    status_.noData = false;
    // The crosshair is rebuilt hidden; restore it if a bar is hovered.
    const auto& crosshairX = interaction_.state().crosshairX;
    if (ok && crosshairX) ok = renderer_.updateCrosshair(crosshairX);
  } else {
    ok = false;
  }

  if (!ok) {
    std::fprintf(stderr, "ChartController: redraw failed for series version %llu\n",
                 static_cast<unsigned long long>(store_.version()));
  }

  if (fromReady || awaitingFirstRender_) {
    awaitingFirstRender_ = false;
    setState(ChartState::Ready);
  }
}

void ChartController::pointerMove(double x, double y) {
  if (disposed()) return;
  interaction_.pointerMove(x, y);
}

void ChartController::pointerLeave() {
  if (disposed()) return;
  interaction_.pointerLeave();
}

void ChartController::click(double x, double y) {
  if (disposed()) return;
  interaction_.click(x, y);
}

void ChartController::dispose() {
  if (disposed()) return;

  *alive_ = false;
  ++fetchGeneration_;
  redrawDirty_ = false;
  redrawScheduled_ = false;

  hoverSub_.reset();
  selectSub_.reset();
  interaction_.clearSeries();
  interaction_.hoverEvents().clear();
  interaction_.dateSelections().clear();
  news_.reset();
  news_.updates().clear();
  renderer_.release();
  store_.clear();
  newsIndex_.reset();
  scales_.reset();

  setState(ChartState::Disposed);
  statusEvents_.clear();
}

} // namespace sl
