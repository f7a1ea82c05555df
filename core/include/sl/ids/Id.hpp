#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sl {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

inline std::string idStr(Id id) { return std::to_string(id); }

// Chart scene plan. Layers draw in ascending id order; each recipe owns the
// ids from its base up to the next base.
inline constexpr Id kChartPaneId = 1;
inline constexpr Id kGridLayerId = 10;
inline constexpr Id kAxisLayerId = 11;
inline constexpr Id kWickLayerId = 12;
inline constexpr Id kBodyLayerId = 13;
inline constexpr Id kVolumeLayerId = 14;
inline constexpr Id kOverlayLayerId = 15;
inline constexpr Id kCrosshairLayerId = 16;
inline constexpr Id kMessageLayerId = 17;

inline constexpr Id kGridIdBase = 100;
inline constexpr Id kAxisIdBase = 200;
inline constexpr Id kCandleIdBase = 300;
inline constexpr Id kVolumeIdBase = 400;
inline constexpr Id kCrosshairIdBase = 900;
inline constexpr Id kMessageIdBase = 950;
inline constexpr Id kMaIdBase = 1000;
inline constexpr Id kVolumeMaIdBase = 2000;
inline constexpr Id kMaIdStride = 10;

// Ids handed out for commands that omit one start above the plan.
inline constexpr Id kFirstAllocatedId = 10000;

inline constexpr Id maIdBase(std::size_t windowIndex) {
  return kMaIdBase + kMaIdStride * static_cast<Id>(windowIndex);
}

inline constexpr Id volumeMaIdBase(std::size_t windowIndex) {
  return kVolumeMaIdBase + kMaIdStride * static_cast<Id>(windowIndex);
}

} // namespace sl
