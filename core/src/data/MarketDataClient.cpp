#include "sl/data/MarketDataClient.hpp"
#include <algorithm>

namespace sl {

const std::vector<std::string>& validPeriods() {
  static const std::vector<std::string> kPeriods = {"1mo", "3mo", "6mo", "1y", "2y"};
  return kPeriods;
}

bool isValidPeriod(const std::string& period) {
  const auto& p = validPeriods();
  return std::find(p.begin(), p.end(), period) != p.end();
}

} // namespace sl
