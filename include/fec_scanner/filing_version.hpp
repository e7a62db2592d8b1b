#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace fec {

// Filing-format version declared in a filing's header ("8.3", "5.00", "2.02").
struct FilingVersion {
  int major = 0;
  int minor = 0;

  constexpr FilingVersion() = default;
  constexpr FilingVersion(int maj, int min) : major(maj), minor(min) {}

  // Accepts "M", "M.m" with optional surrounding spaces and an optional
  // leading 'v'/'V'. Minor digits are read as an integer ("5.00" -> 5.0).
  static std::optional<FilingVersion> parse(std::string_view s);

  std::string str() const;
};

constexpr bool operator==(FilingVersion a, FilingVersion b) { return a.major == b.major && a.minor == b.minor; }
constexpr bool operator!=(FilingVersion a, FilingVersion b) { return !(a == b); }
constexpr bool operator<(FilingVersion a, FilingVersion b) {
  return a.major != b.major ? a.major < b.major : a.minor < b.minor;
}
constexpr bool operator>(FilingVersion a, FilingVersion b) { return b < a; }
constexpr bool operator<=(FilingVersion a, FilingVersion b) { return !(b < a); }
constexpr bool operator>=(FilingVersion a, FilingVersion b) { return !(a < b); }

}
