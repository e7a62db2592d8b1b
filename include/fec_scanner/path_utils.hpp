#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace fec {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Output file for a form-type stream: "SA11AI" -> "SA11AI.csv". Path
// separators and other unsafe characters in the code become '-'.
std::string stream_file_name(std::string_view form_type);

// Filing id from an input path: file stem ("data/1234567.fec" -> "1234567").
std::string filing_id_from_path(std::string_view path);

// Write `content` to `path`, creating parent directories.
bool write_text_file(const std::filesystem::path& path, std::string_view content,
                     std::string* err_out = nullptr);

}
