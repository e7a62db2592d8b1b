#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace fec {

// Case-insensitive by default. Filings mark flags with X/Y/N more often
// than true/false.
struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"X","Y","T","1","true","yes"};
  std::vector<std::string> false_tokens = {"N","F","0","false","no"};
  bool case_sensitive = false;
};

struct ParsePolicy {
  BoolPolicy bool_policy;

  // Optional sign and digits (std::from_chars).
  std::optional<std::int64_t> parse_integer(std::string_view s) const;

  // Decimal amount (fast_float). Infinity and NaN are rejected.
  std::optional<double> parse_decimal(std::string_view s) const;

  // One of the filing date forms, returned as "YYYY-MM-DD".
  std::optional<std::string> parse_date(std::string_view s) const;

  std::optional<bool> parse_bool(std::string_view s) const;
};

// Strip ASCII spaces and tabs at both ends.
std::string_view trim(std::string_view s) noexcept;

bool iequals(std::string_view a, std::string_view b) noexcept;

}
