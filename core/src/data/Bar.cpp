#include "sl/data/Bar.hpp"

namespace sl {

static bool isDigit(char c) { return c >= '0' && c <= '9'; }

static int digits(const std::string& s, std::size_t pos, std::size_t n) {
  int v = 0;
  for (std::size_t i = pos; i < pos + n; i++) v = v * 10 + (s[i] - '0');
  return v;
}

static int daysInMonth(int year, int month) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

bool isValidDayKey(const std::string& s) {
  if (s.size() != 10) return false;
  for (std::size_t i = 0; i < 10; i++) {
    if (i == 4 || i == 7) {
      if (s[i] != '-') return false;
    } else if (!isDigit(s[i])) {
      return false;
    }
  }
  int year = digits(s, 0, 4);
  int month = digits(s, 5, 2);
  int day = digits(s, 8, 2);
  if (month < 1 || month > 12) return false;
  return day >= 1 && day <= daysInMonth(year, month);
}

std::optional<DayKey> toDayKey(const std::string& raw) {
  if (raw.size() < 10) return std::nullopt;
  DayKey key = raw.substr(0, 10);
  if (!isValidDayKey(key)) return std::nullopt;
  if (raw.size() > 10) {
    char sep = raw[10];
    if (sep != 'T' && sep != ' ') return std::nullopt;
  }
  return key;
}

} // namespace sl
