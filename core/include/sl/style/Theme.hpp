#pragma once
#include "sl/ids/Id.hpp"

#include <cstddef>
#include <string>

namespace sl {

struct Theme {
  std::string name;

  float backgroundColor[4] = {0.059f, 0.090f, 0.165f, 1.0f};  // #0f172a

  // Bars: close >= open is "up"
  float candleUp[4] = {0.133f, 0.773f, 0.369f, 1.0f};    // #22c55e
  float candleDown[4] = {0.937f, 0.267f, 0.267f, 1.0f};  // #ef4444
  float volumeUp[4] = {0.133f, 0.773f, 0.369f, 0.5f};
  float volumeDown[4] = {0.937f, 0.267f, 0.267f, 0.5f};

  // Grid/axis
  float gridColor[4] = {0.118f, 0.161f, 0.231f, 1.0f};   // #1e293b
  float tickColor[4] = {0.278f, 0.333f, 0.412f, 1.0f};   // #475569
  float labelColor[4] = {0.580f, 0.639f, 0.722f, 1.0f};  // #94a3b8
  float gridLineWidth{1.0f};
  float gridDash[2] = {2.0f, 2.0f};
  float labelFontSize{10.0f};

  // Crosshair
  float crosshairColor[4] = {0.388f, 0.400f, 0.945f, 1.0f};  // #6366f1
  float crosshairDash[2] = {3.0f, 3.0f};

  // Moving-average overlays, cycled by window index
  float overlayColors[4][4] = {
    {0.231f, 0.510f, 0.965f, 1.0f},  // #3b82f6
    {0.976f, 0.451f, 0.086f, 1.0f},  // #f97316
    {0.659f, 0.333f, 0.969f, 1.0f},  // #a855f7
    {0.024f, 0.714f, 0.831f, 1.0f}   // #06b6d4
  };
  float overlayLineWidth{1.5f};
  float volumeOverlayAlpha{0.8f};
};

Theme darkTheme();
Theme lightTheme();

// "dark" / "light" (case-insensitive); unknown names fall back to dark.
Theme themeByName(const std::string& name);

// "#rrggbb" -> RGBA floats. Returns false on malformed input.
bool parseHexColor(const std::string& hex, float alpha, float out[4]);

const float* overlayColor(const Theme& theme, std::size_t index);

// setDrawItemColor command for CommandProcessor::applyJsonText().
std::string colorCommand(Id drawItemId, const float color[4]);

} // namespace sl
