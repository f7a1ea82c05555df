#include "sl/math/ValueFormat.hpp"
#include <cmath>
#include <cstdio>

namespace sl {

static std::string fmt(const char* pattern, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), pattern, v);
  return buf;
}

std::string formatPriceTick(double v) {
  // Shortest round-trip-ish form: integers print without decimals.
  if (std::fabs(v - std::round(v)) < 1e-9) return fmt("$%.0f", std::round(v));
  return fmt("$%.12g", v);
}

std::string formatVolumeTick(double v) {
  if (v >= 1e9) return fmt("%.1fB", v / 1e9);
  if (v >= 1e6) return fmt("%.1fM", v / 1e6);
  return fmt("%.0fK", v / 1e3);
}

std::string formatPrice(double v) {
  return fmt("$%.2f", v);
}

std::string formatVolume(double v) {
  if (v >= 1e9) return fmt("%.2fB", v / 1e9);
  if (v >= 1e6) return fmt("%.2fM", v / 1e6);
  if (v >= 1e3) return fmt("%.2fK", v / 1e3);
  return fmt("%.0f", v);
}

std::string formatPercent(const std::optional<double>& pct) {
  if (!pct) return "-";
  return fmt(*pct >= 0.0 ? "+%.2f%%" : "%.2f%%", *pct);
}

std::string formatOptionalPrice(const std::optional<double>& v) {
  return v ? formatPrice(*v) : std::string("-");
}

std::string formatOptionalVolume(const std::optional<double>& v) {
  return v ? formatVolume(*v) : std::string("-");
}

} // namespace sl
