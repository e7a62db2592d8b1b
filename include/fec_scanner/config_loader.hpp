#pragma once
#include "fec_scanner/coordinator.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fec {

// Settings of the fec-scanner application. Command-line flags are applied
// on top of whatever a --config file sets.
struct AppConfig {
  std::string output_dir = "output";
  std::size_t jobs = 1;  // 0 = one per hardware thread
  bool silent = false;   // no progress lines on stderr
  bool warn = false;     // per-record issues on stderr
  std::vector<std::string> schema_files; // extra layouts, see load_schemas_file
  std::vector<std::string> inputs;
  StreamCoordinator::Config scan;
};

// Applies the keys of a JSON object:
//   output_dir, jobs, silent, warn, schema_files,
//   version, encoding, delimiter, quote, include_filing_id, emit_header,
//   max_issue_details, chunk_bytes, max_record_bytes, buffer_bytes,
//   true_values, false_values
// Unknown keys and bad values fail with a message in err_out.
bool apply_config_json(std::string_view json, AppConfig& cfg, std::string* err_out = nullptr);
bool load_app_config(const std::string& path, AppConfig& cfg, std::string* err_out = nullptr);

}
