#include "fec_scanner/schema_registry.hpp"

#include <simdjson.h>
#include <cctype>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// {"schemas":[{"version":"8.4","form_type":"SA","codes":"line_number","columns":[
//    "plain_text_column",
//    {"name":"amount","kind":"decimal","required":false},
//    {"name":"entity_type","kind":"enumerated","values":["IND","ORG"]}]}]}

namespace fec {

static std::string version_text(simdjson::ondemand::value v) {
  simdjson::ondemand::json_type t = v.type();
  if (t == simdjson::ondemand::json_type::number) {
    std::string_view tok = v.raw_json_token();
    return std::string(tok);
  }
  std::string_view s = v.get_string();
  return std::string(s);
}

static ColumnSpec read_column(simdjson::ondemand::value v, const std::string& where) {
  ColumnSpec c;
  simdjson::ondemand::json_type t = v.type();
  if (t == simdjson::ondemand::json_type::string) {
    std::string_view s = v.get_string();
    c.name = std::string(s);
    return c;
  }
  simdjson::ondemand::object obj = v.get_object();
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    simdjson::ondemand::value fv = field.value();
    if (key == "name") {
      std::string_view s = fv.get_string();
      c.name = std::string(s);
    } else if (key == "kind") {
      std::string_view s = fv.get_string();
      auto k = parse_column_kind(s);
      if (!k) throw std::invalid_argument(where + ": unknown column kind '" + std::string(s) + "'");
      c.kind = *k;
    } else if (key == "required") {
      c.required = fv.get_bool();
    } else if (key == "values") {
      for (auto item : fv.get_array()) {
        std::string_view s = item.get_string();
        c.allowed.emplace_back(s);
      }
    }
  }
  if (c.name.empty()) throw std::invalid_argument(where + ": column without a name");
  return c;
}

static bool load_padded(const simdjson::padded_string& json, SchemaRegistry& registry, std::string* err_out) {
  simdjson::ondemand::parser parser;
  std::size_t n = 0;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::array schemas = doc["schemas"].get_array();
    for (auto entry_v : schemas) {
      const std::string where = "schemas[" + std::to_string(n++) + "]";
      std::string ver, form;
      std::optional<CodeRule> codes;
      std::vector<ColumnSpec> cols;
      simdjson::ondemand::object entry = entry_v.get_object();
      for (auto field : entry) {
        std::string_view key = field.unescaped_key();
        simdjson::ondemand::value v = field.value();
        if (key == "version") {
          ver = version_text(v);
        } else if (key == "form_type") {
          std::string_view s = v.get_string();
          form = std::string(s);
          for (auto& ch : form) ch = static_cast<char>(std::toupper((unsigned char)ch));
        } else if (key == "codes") {
          std::string_view s = v.get_string();
          codes = parse_code_rule(s);
          if (!codes) throw std::invalid_argument(where + ": unknown codes rule '" + std::string(s) + "'");
        } else if (key == "columns") {
          std::size_t i = 0;
          for (auto col : v.get_array()) {
            cols.push_back(read_column(col.value(), where + ".columns[" + std::to_string(i++) + "]"));
          }
        }
      }
      auto version = FilingVersion::parse(ver);
      if (!version) throw std::invalid_argument(where + ": bad or missing version '" + ver + "'");
      if (form.empty()) throw std::invalid_argument(where + ": missing form_type");
      // a new layout for a shipped family keeps that family's code rule
      if (!codes) codes = registry.code_rule(form);
      registry.add(*version, form, std::move(cols), codes.value_or(CodeRule::Amendment));
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = "schema json (entry " + std::to_string(n) + "): " + e.what();
    return false;
  } catch (const std::exception& e) {
    if (err_out) *err_out = e.what();
    return false;
  }
  return true;
}

bool load_schemas_json(std::string_view json, SchemaRegistry& registry, std::string* err_out) {
  simdjson::padded_string padded(json);
  return load_padded(padded, registry, err_out);
}

bool load_schemas_file(const std::string& path, SchemaRegistry& registry, std::string* err_out) {
  simdjson::padded_string json;
  auto error = simdjson::padded_string::load(path).get(json);
  if (error) {
    if (err_out) *err_out = "cannot read " + path + ": " + simdjson::error_message(error);
    return false;
  }
  if (!load_padded(json, registry, err_out)) {
    if (err_out) *err_out = path + ": " + *err_out;
    return false;
  }
  return true;
}

}
