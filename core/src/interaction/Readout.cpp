#include "sl/interaction/Readout.hpp"
#include "sl/math/ValueFormat.hpp"

namespace sl {

Readout makeReadout(const Bar& bar, const MaWindows& windows) {
  Readout r;
  r.date = bar.time;
  r.open = formatPrice(bar.open);
  r.high = formatPrice(bar.high);
  r.low = formatPrice(bar.low);
  r.close = formatPrice(bar.close);
  r.volume = formatVolume(bar.volume);
  r.closeChange = formatPercent(bar.closeChangePct);
  r.volumeChange = formatPercent(bar.volumeChangePct);

  for (std::size_t k = 0; k < windows.size(); k++) {
    const std::string n = std::to_string(windows[k]);
    std::optional<double> ma = k < bar.ma.size() ? bar.ma[k] : std::nullopt;
    std::optional<double> vma = k < bar.volMa.size() ? bar.volMa[k] : std::nullopt;
    r.ma.emplace_back("MA" + n, formatOptionalPrice(ma));
    r.volMa.emplace_back("VOL MA" + n, formatOptionalVolume(vma));
  }
  return r;
}

} // namespace sl
