#include "sl/interaction/InteractionController.hpp"
#include <utility>

namespace sl {

void InteractionController::setSeries(std::shared_ptr<const BarSeries> series,
                                      const Scales* scales) {
  const bool hadHover = state_.hoveredIndex.has_value();
  series_ = std::move(series);
  state_ = InteractionState{};
  regions_.clear();
  if (series_ && !series_->empty() && scales) regions_.build(*scales);

  if (hadHover) hoverEvents_.publish(nullptr);
}

void InteractionController::relayout(const Scales& scales) {
  if (!series_ || series_->empty()) return;
  regions_.build(scales);
  if (state_.hoveredIndex && *state_.hoveredIndex < regions_.size()) {
    state_.crosshairX = regions_[*state_.hoveredIndex].centerX;
  }
}

const Bar* InteractionController::hoveredBar() const {
  if (!series_ || !state_.hoveredIndex) return nullptr;
  return &(*series_)[*state_.hoveredIndex];
}

bool InteractionController::setHover(std::optional<std::size_t> index) {
  if (index == state_.hoveredIndex) return false;

  state_.hoveredIndex = index;
  if (index) state_.crosshairX = regions_[*index].centerX;
  else state_.crosshairX.reset();

  hoverEvents_.publish(hoveredBar());
  return true;
}

bool InteractionController::pointerMove(double x, double y) {
  return setHover(regions_.regionAt(x, y));
}

bool InteractionController::pointerLeave() {
  return setHover(std::nullopt);
}

std::optional<DayKey> InteractionController::click(double x, double y) {
  auto index = regions_.regionAt(x, y);
  setHover(index);
  if (!index) return std::nullopt;

  DayKey day = (*series_)[*index].time;
  state_.selectedDate = day;
  dateSelections_.publish(day);
  return day;
}

} // namespace sl
