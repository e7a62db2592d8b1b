#pragma once
#include "fec_scanner/filing_version.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fec {

// How raw field bytes are turned into UTF-8 text.
//   Utf8        -> validate, invalid sequences become U+FFFD
//   Windows1252 -> legacy single-byte Western code page, transcoded
//   Sniff       -> keep valid UTF-8 as-is, otherwise transcode as ISO-8859-1
enum class EncodingMode { Utf8, Windows1252, Sniff };

const char* encoding_mode_name(EncodingMode m) noexcept;

// Accepts "utf8", "utf-8", "windows-1252", "cp1252", "latin1", "sniff", ...
std::optional<EncodingMode> parse_encoding_mode(std::string_view s);

// Filings older than this version default to Windows1252.
constexpr FilingVersion kUtf8CutoverVersion{8, 0};

EncodingMode default_encoding_for(FilingVersion v) noexcept;

// U+FFFD REPLACEMENT CHARACTER, substituted for undecodable input.
constexpr std::string_view kPlaceholder = "\xEF\xBF\xBD";

bool is_ascii(std::string_view s) noexcept;
bool is_valid_utf8(std::string_view s) noexcept;

// Appends the UTF-8 form of `bytes` to `out`. Returns the number of
// placeholder substitutions made (degraded characters).
std::size_t normalize_into(std::string_view bytes, EncodingMode mode, std::string& out);

std::string normalize(std::string_view bytes, EncodingMode mode, std::size_t* degraded = nullptr);

}
