#include "sl/style/Theme.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace sl {

static void set4(float dst[4], const float src[4]) {
  for (int i = 0; i < 4; i++) dst[i] = src[i];
}

static void setHex(float dst[4], const char* hex, float alpha = 1.0f) {
  parseHexColor(hex, alpha, dst);
}

Theme darkTheme() {
  Theme t;
  t.name = "dark";
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "light";
  setHex(t.backgroundColor, "#f8fafc");
  setHex(t.candleUp, "#16a34a");
  setHex(t.candleDown, "#dc2626");
  setHex(t.volumeUp, "#16a34a", 0.5f);
  setHex(t.volumeDown, "#dc2626", 0.5f);
  setHex(t.gridColor, "#e2e8f0");
  setHex(t.tickColor, "#94a3b8");
  setHex(t.labelColor, "#475569");
  setHex(t.crosshairColor, "#4f46e5");
  setHex(t.overlayColors[0], "#2563eb");
  setHex(t.overlayColors[1], "#ea580c");
  setHex(t.overlayColors[2], "#9333ea");
  setHex(t.overlayColors[3], "#0891b2");
  return t;
}

Theme themeByName(const std::string& name) {
  std::string lower;
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "light") return lightTheme();
  return darkTheme();
}

bool parseHexColor(const std::string& hex, float alpha, float out[4]) {
  if (hex.size() != 7 || hex[0] != '#') return false;
  unsigned rgb[3];
  for (int i = 0; i < 3; i++) {
    unsigned v = 0;
    for (int j = 0; j < 2; j++) {
      char c = static_cast<char>(std::tolower(static_cast<unsigned char>(hex[1 + i * 2 + j])));
      v <<= 4;
      if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(c - 'a' + 10);
      else return false;
    }
    rgb[i] = v;
  }
  const float c[4] = {rgb[0] / 255.0f, rgb[1] / 255.0f, rgb[2] / 255.0f, alpha};
  set4(out, c);
  return true;
}

const float* overlayColor(const Theme& theme, std::size_t index) {
  return theme.overlayColors[index % 4];
}

std::string colorCommand(Id drawItemId, const float color[4]) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemColor","drawItemId":%llu,"r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(color[0]), static_cast<double>(color[1]),
    static_cast<double>(color[2]), static_cast<double>(color[3]));
  return buf;
}

} // namespace sl
