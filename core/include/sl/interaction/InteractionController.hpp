#pragma once
#include "sl/data/BarSeries.hpp"
#include "sl/events/EventStream.hpp"
#include "sl/interaction/HitRegions.hpp"
#include "sl/layout/Scales.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace sl {

struct InteractionState {
  std::optional<std::size_t> hoveredIndex;
  std::optional<DayKey> selectedDate;
  std::optional<double> crosshairX;

  bool empty() const { return !hoveredIndex && !selectedDate && !crosshairX; }
};

// Owns the interaction state. Pointer events are in canvas pixels.
// Hover is published as the hovered bar, or nullptr when cleared, and only
// when it changes.
class InteractionController {
public:
  InteractionController() = default;

  // New series: state resets and regions are rebuilt. A null or empty
  // series leaves no regions.
  void setSeries(std::shared_ptr<const BarSeries> series, const Scales* scales);
  void clearSeries() { setSeries(nullptr, nullptr); }

  // Same series, new geometry (resize). Hover is kept and the crosshair
  // follows the bar's new center.
  void relayout(const Scales& scales);

  // Returns true when the hovered bar changed.
  bool pointerMove(double x, double y);
  bool pointerLeave();

  // Hovers like pointerMove, then selects the bar's day. Returns the
  // selected day, or nullopt outside every region.
  std::optional<DayKey> click(double x, double y);

  const InteractionState& state() const { return state_; }
  const Bar* hoveredBar() const;
  const HitRegions& regions() const { return regions_; }

  EventStream<const Bar*>& hoverEvents() { return hoverEvents_; }
  EventStream<DayKey>& dateSelections() { return dateSelections_; }

private:
  bool setHover(std::optional<std::size_t> index);

  std::shared_ptr<const BarSeries> series_;
  HitRegions regions_;
  InteractionState state_;

  EventStream<const Bar*> hoverEvents_;
  EventStream<DayKey> dateSelections_;
};

} // namespace sl
