#include "fec_scanner/parse_policy.hpp"
#include "fec_scanner/date_parse.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <string_view>
#include <fast_float/fast_float.h>

namespace fec {

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

std::optional<std::int64_t> ParsePolicy::parse_integer(std::string_view s) const {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> ParsePolicy::parse_decimal(std::string_view s) const {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (!std::isfinite(out)) return std::nullopt;
  return out;
}

std::optional<std::string> ParsePolicy::parse_date(std::string_view s) const {
  auto d = parse_filing_date(s);
  if (!d) return std::nullopt;
  return format_iso_date(*d);
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  for (const auto& t : bool_policy.true_tokens) {
    if (bool_policy.case_sensitive ? (s == t) : iequals(s, t)) return true;
  }
  for (const auto& f : bool_policy.false_tokens) {
    if (bool_policy.case_sensitive ? (s == f) : iequals(s, f)) return false;
  }
  return std::nullopt;
}

}
