#include "fec_scanner/config_loader.hpp"
#include "fec_scanner/header.hpp"

#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace fec {

static std::string read_string(simdjson::ondemand::value v) {
  std::string_view s = v.get_string();
  return std::string(s);
}

static std::vector<std::string> read_strings(simdjson::ondemand::value v) {
  std::vector<std::string> out;
  for (auto item : v.get_array()) {
    std::string_view s = item.get_string();
    out.emplace_back(s);
  }
  return out;
}

static std::size_t read_size(simdjson::ondemand::value v, std::string_view key) {
  std::uint64_t x = v.get_uint64();
  if (x == 0) throw std::invalid_argument(std::string(key) + " must be positive");
  return static_cast<std::size_t>(x);
}

static bool apply_padded(const simdjson::padded_string& json, AppConfig& cfg, std::string* err_out) {
  simdjson::ondemand::parser parser;
  std::string current;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object root = doc.get_object();
    for (auto field : root) {
      std::string_view key = field.unescaped_key();
      current = std::string(key);
      simdjson::ondemand::value v = field.value();

      if (key == "output_dir")             cfg.output_dir = read_string(v);
      else if (key == "jobs")              cfg.jobs = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      else if (key == "silent")            cfg.silent = v.get_bool();
      else if (key == "warn")              cfg.warn = v.get_bool();
      else if (key == "schema_files")      cfg.schema_files = read_strings(v);
      else if (key == "include_filing_id") cfg.scan.include_filing_id = v.get_bool();
      else if (key == "emit_header")       cfg.scan.emit_header = v.get_bool();
      else if (key == "max_issue_details") cfg.scan.max_issue_details = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      else if (key == "max_quoted_lines")  cfg.scan.max_quoted_lines = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      else if (key == "chunk_bytes")       cfg.scan.reader.chunk_bytes = read_size(v, key);
      else if (key == "max_record_bytes")  cfg.scan.reader.max_record_bytes = read_size(v, key);
      else if (key == "buffer_bytes")      cfg.scan.emitter.buffer_bytes = read_size(v, key);
      else if (key == "true_values")       cfg.scan.policy.bool_policy.true_tokens = read_strings(v);
      else if (key == "false_values")      cfg.scan.policy.bool_policy.false_tokens = read_strings(v);
      else if (key == "version") {
        simdjson::ondemand::json_type t = v.type();
        std::string s;
        if (t == simdjson::ondemand::json_type::number) {
          std::string_view tok = v.raw_json_token();
          s = std::string(tok);
        } else {
          s = read_string(v);
        }
        auto ver = FilingVersion::parse(s);
        if (!ver) throw std::invalid_argument("bad version '" + s + "'");
        cfg.scan.version_override = *ver;
      } else if (key == "encoding") {
        std::string s = read_string(v);
        auto m = parse_encoding_mode(s);
        if (!m) throw std::invalid_argument("unknown encoding '" + s + "'");
        cfg.scan.encoding_override = *m;
      } else if (key == "delimiter") {
        std::string s = read_string(v);
        auto d = parse_delimiter(s);
        if (!d) throw std::invalid_argument("unknown delimiter '" + s + "'");
        cfg.scan.delimiter_override = *d;
      } else if (key == "quote") {
        std::string s = read_string(v);
        if (s.size() > 1) throw std::invalid_argument("quote must be one character or empty");
        cfg.scan.quote = s.empty() ? '\0' : s[0];
      } else {
        throw std::invalid_argument("unknown key");
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = current.empty() ? std::string(e.what()) : current + ": " + e.what();
    return false;
  } catch (const std::exception& e) {
    if (err_out) *err_out = current.empty() ? std::string(e.what()) : current + ": " + e.what();
    return false;
  }
  return true;
}

bool apply_config_json(std::string_view json, AppConfig& cfg, std::string* err_out) {
  simdjson::padded_string padded(json);
  return apply_padded(padded, cfg, err_out);
}

bool load_app_config(const std::string& path, AppConfig& cfg, std::string* err_out) {
  simdjson::padded_string json;
  auto error = simdjson::padded_string::load(path).get(json);
  if (error) {
    if (err_out) *err_out = "cannot read " + path + ": " + simdjson::error_message(error);
    return false;
  }
  if (!apply_padded(json, cfg, err_out)) {
    if (err_out) *err_out = path + ": " + *err_out;
    return false;
  }
  return true;
}

}
