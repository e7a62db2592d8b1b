#include "fec_scanner/path_utils.hpp"
#include <fstream>

namespace fec {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string stream_file_name(std::string_view form_type) {
  std::string s(form_type);
  for (auto& c : s) {
    if (c=='/' || c=='\\' || c==':' || c=='*' || c=='?' || c=='"' || c=='<' || c=='>' || c=='|'
        || static_cast<unsigned char>(c) < 0x20)
      c='-';
  }
  if (s.empty() || s == "." || s == "..") s = "_" + s;
  return s + ".csv";
}

std::string filing_id_from_path(std::string_view path) {
  auto stem = std::filesystem::path(std::string(path)).stem().string();
  return stem.empty() ? std::string("filing") : stem;
}

bool write_text_file(const std::filesystem::path& path, std::string_view content,
                     std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create directory for " + path.string();
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err_out) *err_out = "failed to write " + path.string();
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + path.string();
    return false;
  }
  return true;
}

}
