#pragma once
#include "sl/data/Bar.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sl {

// Display strings for the hovered bar.
struct Readout {
  std::string date;
  std::string open, high, low, close;
  std::string volume;
  std::string closeChange;
  std::string volumeChange;
  std::vector<std::pair<std::string, std::string>> ma;     // {"MA5", "$101.20"}
  std::vector<std::pair<std::string, std::string>> volMa;  // {"VOL MA5", "1.20M"}
};

Readout makeReadout(const Bar& bar, const MaWindows& windows);

} // namespace sl
