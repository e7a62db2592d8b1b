#include "fec_scanner/date_parse.hpp"
#include <cstdio>

namespace fec {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

bool is_valid_civil_date(int year, int month, int day) noexcept {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (year < 1 || month < 1 || month > 12 || day < 1) return false;
  int limit = days[month - 1];
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) limit = 29;
  return day <= limit;
}

std::optional<CivilDate> parse_filing_date(std::string_view s) {
  CivilDate d;
  if (s.size() == 8) {
    // YYYYMMDD
    if (!(parse_int(s.substr(0,4), d.year) && parse_int(s.substr(4,2), d.month) && parse_int(s.substr(6,2), d.day)))
      return std::nullopt;
  } else if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
    // YYYY-MM-DD
    if (!(parse_int(s.substr(0,4), d.year) && parse_int(s.substr(5,2), d.month) && parse_int(s.substr(8,2), d.day)))
      return std::nullopt;
  } else {
    // M/D/YYYY, MM/DD/YYYY
    auto a = s.find('/');
    if (a == std::string_view::npos || a == 0 || a > 2) return std::nullopt;
    auto b = s.find('/', a + 1);
    if (b == std::string_view::npos || b - a - 1 == 0 || b - a - 1 > 2) return std::nullopt;
    if (s.size() - b - 1 != 4) return std::nullopt;
    if (!(parse_int(s.substr(0,a), d.month) && parse_int(s.substr(a+1, b-a-1), d.day) && parse_int(s.substr(b+1), d.year)))
      return std::nullopt;
  }
  if (!is_valid_civil_date(d.year, d.month, d.day)) return std::nullopt;
  return d;
}

std::string format_iso_date(const CivilDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return std::string(buf);
}

}
