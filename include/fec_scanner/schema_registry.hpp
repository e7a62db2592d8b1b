#pragma once
#include "fec_scanner/filing_version.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fec {

enum class ColumnKind { Text, Integer, Decimal, Date, Boolean, Enumerated };

const char* column_kind_name(ColumnKind k) noexcept;
std::optional<ColumnKind> parse_column_kind(std::string_view s);

struct ColumnSpec {
  std::string name;
  std::size_t position = 0;          // assigned by SchemaRegistry::add
  ColumnKind  kind     = ColumnKind::Text;
  bool        required = false;
  std::vector<std::string> allowed;  // Enumerated only, compared case-insensitively
};

// How record codes map onto a registered family.
//   Amendment:  the family name, optionally followed by one of N/A/T
//               ("F3X", "F3XN", "F3XA").
//   LineNumber: the family name followed by a line number that starts with a
//               digit ("SA11AI", "SB23").
enum class CodeRule { Amendment, LineNumber };

const char* code_rule_name(CodeRule r) noexcept;
std::optional<CodeRule> parse_code_rule(std::string_view s);

struct Schema {
  FilingVersion version;
  std::string   form_type;           // form family key, e.g. "SA"
  std::vector<ColumnSpec> columns;

  std::size_t size() const noexcept { return columns.size(); }
  std::optional<std::size_t> index_of(std::string_view column) const;
};

// Column layouts keyed by (filing version, form family).
//
// Populated during warm-up, then frozen. After freeze() the registry is only
// read, so coordinators on different threads may share one instance.
class SchemaRegistry {
public:
  // Registers a layout. Positions are assigned from the vector order.
  // Throws std::logic_error after freeze(), std::invalid_argument on an
  // empty form type/column list, duplicate column names, a duplicate key, or
  // a code rule that differs from the one the family was first added with.
  const Schema& add(FilingVersion version, std::string form_type,
                    std::vector<ColumnSpec> columns,
                    CodeRule codes = CodeRule::Amendment);

  void freeze() noexcept { frozen_ = true; }
  bool frozen() const noexcept { return frozen_; }

  // Exact (version, family) match, else the nearest prior registered version
  // of that family. nullptr when no version <= `version` exists.
  const Schema* resolve(FilingVersion version, std::string_view form_type) const;

  // Family for an upper-cased record code under the family's CodeRule.
  // "F3XN" -> "F3X", "SA11AI" -> "SA"; "F3PN" and "SAXYZ" have none.
  std::optional<std::string_view> family_of(std::string_view code) const;

  std::optional<CodeRule> code_rule(std::string_view form_type) const;

  std::vector<FilingVersion> versions_for(std::string_view form_type) const;

  // True when at least one family has a layout at or below `version`.
  bool covers(FilingVersion version) const;

  std::size_t size() const noexcept { return count_; }

private:
  struct Family {
    CodeRule codes = CodeRule::Amendment;
    std::map<FilingVersion, Schema> versions;
  };
  std::map<std::string, Family, std::less<>> by_form_;
  std::size_t count_{0};
  bool frozen_{false};
};

// Shipped layouts (HDR, F3, F3X, F99, SA, SB, TEXT).
void register_builtin_schemas(SchemaRegistry& registry);

// Reads {"schemas":[{"version":..,"form_type":..,"codes":..,"columns":[..]}]}
// and registers each entry. "codes" is "amendment" (default) or "line_number". Returns false and fills err_out on malformed input.
bool load_schemas_json(std::string_view json, SchemaRegistry& registry,
                       std::string* err_out = nullptr);
bool load_schemas_file(const std::string& path, SchemaRegistry& registry,
                       std::string* err_out = nullptr);

}
