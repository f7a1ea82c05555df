#pragma once
#include <optional>
#include <string>

namespace sl {

// Axis labels
std::string formatPriceTick(double v);    // "$105", "$102.5"
std::string formatVolumeTick(double v);   // "1.2B", "3.4M", "560K"

// Readout panel
std::string formatPrice(double v);                      // "$104.00"
std::string formatVolume(double v);                     // "1.50K", "2.35M", "999"
std::string formatPercent(const std::optional<double>& pct);  // "+1.23%", "-0.45%", "-"
std::string formatOptionalPrice(const std::optional<double>& v);   // "$x.xx" or "-"
std::string formatOptionalVolume(const std::optional<double>& v);  // formatVolume or "-"

} // namespace sl
