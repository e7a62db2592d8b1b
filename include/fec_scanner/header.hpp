#pragma once
#include "fec_scanner/filing_version.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fec {

// What the leading record(s) of a filing declare.
struct FilingHeader {
  std::optional<FilingVersion> version;
  char delimiter = ',';
  bool legacy = false;          // "/* Header" block (versions 1 and 2)
  std::string version_text;     // version as written
  std::string software;         // "name version", when declared
  std::map<std::string, std::string> fields; // legacy key = value pairs
};

// Removes a leading UTF-8 byte order mark.
std::string_view strip_bom(std::string_view s) noexcept;

// "HDR<d>FEC<d>8.3<d>..." with <d> the file separator or a comma. The
// delimiter is the override when given, else the file separator if the
// record contains one, else a comma. Returns false with `err` set when the
// record is not an HDR record or the version field is missing or unparseable
// (`out.delimiter` is still filled in).
bool parse_modern_header(std::string_view record, std::optional<char> delimiter_override,
                         char quote, FilingHeader& out, std::string& err);

bool is_legacy_header_start(std::string_view record) noexcept;
bool is_legacy_header_end(std::string_view record) noexcept;

// Reads one "key = value" line of a legacy header block into `out`.
// "FEC_Ver_#" sets the version; "Soft_Name"/"Soft_Ver#" the software.
void add_legacy_header_line(std::string_view line, FilingHeader& out);

// Value of a legacy header key, compared case-insensitively.
std::string legacy_header_value(const FilingHeader& h, std::string_view key);

// "[BEGINTEXT]" / "[BEGIN TEXT]" and "[ENDTEXT]" / "[END TEXT]",
// case-insensitive, surrounding blanks allowed.
bool is_text_block_begin(std::string_view record) noexcept;
bool is_text_block_end(std::string_view record) noexcept;

// "comma", "fs", or "0xNN".
std::string delimiter_name(char d);
std::optional<char> parse_delimiter(std::string_view s);

}
