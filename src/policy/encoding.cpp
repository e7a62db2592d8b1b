#include "fec_scanner/encoding.hpp"

#include <simdutf.h>

#include <cctype>
#include <cstdint>

namespace fec {

// Windows-1252 code points for bytes 0x80-0x9F. 0 marks the five undefined
// bytes, which become the placeholder. 0xA0-0xFF match ISO-8859-1.
static const std::uint32_t kCp1252High[32] = {
  0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
  0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
  0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
  0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

static void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Bytes to replace with one placeholder at an invalid sequence starting at
// s[pos]: a lead byte with all the continuation bytes it announces swallows
// that whole shape (overlong, surrogate, beyond U+10FFFF), anything else
// is one byte.
static std::size_t invalid_span(std::string_view s, std::size_t pos) {
  const auto b = static_cast<unsigned char>(s[pos]);
  std::size_t len;
  if ((b & 0xE0) == 0xC0)      len = 2;
  else if ((b & 0xF0) == 0xE0) len = 3;
  else if ((b & 0xF8) == 0xF0) len = 4;
  else return 1;
  if (pos + len > s.size()) return 1;
  for (std::size_t i = 1; i < len; ++i)
    if ((static_cast<unsigned char>(s[pos + i]) & 0xC0) != 0x80) return 1;
  return len;
}

static void append_latin1(std::string& out, std::string_view bytes) {
  const std::size_t at = out.size();
  out.resize(at + simdutf::utf8_length_from_latin1(bytes.data(), bytes.size()));
  const std::size_t written = simdutf::convert_latin1_to_utf8(bytes.data(), bytes.size(), &out[at]);
  out.resize(at + written);
}

const char* encoding_mode_name(EncodingMode m) noexcept {
  switch (m) {
    case EncodingMode::Utf8:        return "utf-8";
    case EncodingMode::Windows1252: return "windows-1252";
    case EncodingMode::Sniff:       return "sniff";
  }
  return "utf-8";
}

std::optional<EncodingMode> parse_encoding_mode(std::string_view s) {
  std::string n;
  n.reserve(s.size());
  for (char c : s) {
    if (c == '-' || c == '_' || c == ' ') continue;
    n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (n == "utf8") return EncodingMode::Utf8;
  if (n == "windows1252" || n == "cp1252" || n == "win1252" || n == "latin1" || n == "iso88591")
    return EncodingMode::Windows1252;
  if (n == "sniff" || n == "auto") return EncodingMode::Sniff;
  return std::nullopt;
}

EncodingMode default_encoding_for(FilingVersion v) noexcept {
  return v < kUtf8CutoverVersion ? EncodingMode::Windows1252 : EncodingMode::Utf8;
}

bool is_ascii(std::string_view s) noexcept {
  for (char c : s) if (static_cast<unsigned char>(c) >= 0x80) return false;
  return true;
}

bool is_valid_utf8(std::string_view s) noexcept {
  return simdutf::validate_utf8(s.data(), s.size());
}

std::size_t normalize_into(std::string_view bytes, EncodingMode mode, std::string& out) {
  if (is_ascii(bytes)) { out.append(bytes); return 0; }

  if (mode == EncodingMode::Sniff) {
    if (is_valid_utf8(bytes)) { out.append(bytes); return 0; }
    append_latin1(out, bytes);
    return 0;
  }

  std::size_t degraded = 0;
  if (mode == EncodingMode::Windows1252) {
    out.reserve(out.size() + bytes.size() * 2);
    for (unsigned char b : bytes) {
      if (b < 0x80) { out.push_back(static_cast<char>(b)); continue; }
      if (b >= 0xA0) { append_utf8(out, b); continue; }
      std::uint32_t cp = kCp1252High[b - 0x80];
      if (cp == 0) { out.append(kPlaceholder); ++degraded; }
      else append_utf8(out, cp);
    }
    return degraded;
  }

  // copy each valid run, then one placeholder per invalid sequence
  out.reserve(out.size() + bytes.size());
  std::size_t i = 0;
  while (i < bytes.size()) {
    const std::string_view rest = bytes.substr(i);
    const simdutf::result r = simdutf::validate_utf8_with_errors(rest.data(), rest.size());
    if (r.error == simdutf::error_code::SUCCESS) { out.append(rest); break; }
    out.append(rest.substr(0, r.count));
    out.append(kPlaceholder);
    ++degraded;
    i += r.count + invalid_span(rest, r.count);
  }
  return degraded;
}

std::string normalize(std::string_view bytes, EncodingMode mode, std::size_t* degraded) {
  std::string out;
  std::size_t d = normalize_into(bytes, mode, out);
  if (degraded) *degraded += d;
  return out;
}

}
