#include "fec_scanner/header.hpp"
#include "fec_scanner/parse_policy.hpp"
#include "fec_scanner/tokenizer.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace fec {

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower((unsigned char)c));
  return out;
}

// Trim including CR/LF and other control whitespace.
static std::string_view trim_all(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back()))  s.remove_suffix(1);
  return s;
}

std::string_view strip_bom(std::string_view s) noexcept {
  if (s.size() >= 3 && s.compare(0, 3, "\xEF\xBB\xBF") == 0) s.remove_prefix(3);
  return s;
}

bool parse_modern_header(std::string_view record, std::optional<char> delimiter_override,
                         char quote, FilingHeader& out, std::string& err) {
  record = strip_bom(record);
  out.legacy = false;
  if (delimiter_override) out.delimiter = *delimiter_override;
  else out.delimiter = record.find(kFileSeparator) != std::string_view::npos ? kFileSeparator : kCommaDelimiter;

  // the tokenizer unescapes in place; work on a copy
  std::string buf(record);
  Tokenizer tok(buf.data(), buf.size(), out.delimiter, quote);
  Token t;
  if (!tok.next(t) || !iequals(trim(t.text), "HDR")) {
    err = "header record is not HDR";
    return false;
  }
  if (!tok.next(t) || !tok.next(t) || trim(t.text).empty()) {
    err = "header missing version field";
    return false;
  }
  out.version_text = std::string(trim(t.text));
  out.version = FilingVersion::parse(out.version_text);
  if (!out.version) {
    err = "unparseable version '" + out.version_text + "'";
    return false;
  }
  if (tok.next(t)) {
    out.software = std::string(trim(t.text));
    if (tok.next(t) && !trim(t.text).empty()) out.software += " " + std::string(trim(t.text));
  }
  return true;
}

bool is_legacy_header_start(std::string_view record) noexcept {
  std::string_view s = trim_all(strip_bom(record));
  return s.size() >= 2 && s[0] == '/' && s[1] == '*';
}

bool is_legacy_header_end(std::string_view record) noexcept {
  if (!is_legacy_header_start(record)) return false;
  return lower(record).find("end") != std::string::npos;
}

void add_legacy_header_line(std::string_view line, FilingHeader& out) {
  auto eq = line.find('=');
  if (eq == std::string_view::npos) return;
  std::string_view key = trim_all(line.substr(0, eq));
  std::string_view value = trim_all(line.substr(eq + 1));
  if (key.empty()) return;
  out.fields[std::string(key)] = std::string(value);

  if (iequals(key, "FEC_Ver_#")) {
    out.version_text = std::string(value);
    out.version = FilingVersion::parse(value);
  } else if (iequals(key, "Soft_Name")) {
    out.software = std::string(value) + out.software;
  } else if (iequals(key, "Soft_Ver#")) {
    out.software += " " + std::string(value);
  }
}

std::string legacy_header_value(const FilingHeader& h, std::string_view key) {
  for (const auto& kv : h.fields) if (iequals(kv.first, key)) return kv.second;
  return {};
}

static std::string marker_word(std::string_view record) {
  std::string_view s = trim_all(record);
  if (s.size() < 2 || s.front() != '[' || s.back() != ']') return {};
  std::string out;
  for (char c : s.substr(1, s.size() - 2)) {
    if (c == ' ') continue;
    out.push_back(static_cast<char>(std::toupper((unsigned char)c)));
  }
  return out;
}

bool is_text_block_begin(std::string_view record) noexcept {
  if (record.size() > 32) return false;
  return marker_word(record) == "BEGINTEXT";
}

bool is_text_block_end(std::string_view record) noexcept {
  if (record.size() > 32) return false;
  return marker_word(record) == "ENDTEXT";
}

std::string delimiter_name(char d) {
  if (d == kCommaDelimiter) return "comma";
  if (d == kFileSeparator) return "fs";
  if (d == '\t') return "tab";
  if (std::isprint((unsigned char)d)) return std::string(1, d);
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(static_cast<unsigned char>(d)));
  return buf;
}

std::optional<char> parse_delimiter(std::string_view s) {
  std::string n = lower(trim_all(s));
  if (n == "comma" || n == ",") return kCommaDelimiter;
  if (n == "fs" || n == "ascii28" || n == "28") return kFileSeparator;
  if (n == "tab") return '\t';
  if (n.size() == 4 && n[0] == '0' && n[1] == 'x') {
    unsigned v = 0;
    auto [p, ec] = std::from_chars(n.data() + 2, n.data() + n.size(), v, 16);
    if (ec == std::errc() && p == n.data() + n.size() && v > 0) return static_cast<char>(v);
    return std::nullopt;
  }
  if (n.size() == 1 && s.size() == 1) return s[0];
  return std::nullopt;
}

}
