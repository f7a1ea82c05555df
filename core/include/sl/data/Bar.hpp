#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sl {

// Calendar-day key "YYYY-MM-DD". The join key between bars and news.
using DayKey = std::string;

bool isValidDayKey(const std::string& s);

// Truncates timestamps to the day ("2024-01-02T00:00:00" -> "2024-01-02").
// Returns nullopt when the first ten characters are not a valid day.
std::optional<DayKey> toDayKey(const std::string& raw);

// Moving-average window sizes carried per bar, e.g. {5, 20, 60, 120}.
using MaWindows = std::vector<int>;

inline MaWindows defaultMaWindows() { return {5, 20, 60, 120}; }

struct Bar {
  DayKey time;
  double open{0};
  double high{0};
  double low{0};
  double close{0};
  double volume{0};

  // Indexed like the series' MaWindows; nullopt where history is short.
  std::vector<std::optional<double>> ma;
  std::vector<std::optional<double>> volMa;

  std::optional<double> closeChangePct;
  std::optional<double> volumeChangePct;

  bool isUp() const { return close >= open; }
};

struct NewsItem {
  std::string title;
  std::string summary;
  std::optional<std::string> url;
  std::string source;
  DayKey pubDate;
};

} // namespace sl
