#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace fec {

struct CivilDate {
  int year = 0;
  int month = 0;
  int day = 0;
};

// Filing date forms: YYYYMMDD, YYYY-MM-DD, MM/DD/YYYY (1- or 2-digit month
// and day allowed in the slash form). Calendar-checked, leap years included.
std::optional<CivilDate> parse_filing_date(std::string_view s);

bool is_valid_civil_date(int year, int month, int day) noexcept;

// "YYYY-MM-DD"
std::string format_iso_date(const CivilDate& d);

}
