#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fec {

struct Schema;

// One built row. `values` is in schema column order and owns its text, so it
// may outlive the record buffer it was cut from.
struct StructuredRecord {
  std::string form_type;           // code as written in the record, upper-cased
  const Schema* schema = nullptr;  // registry-owned
  std::vector<std::string> values;
  std::uint64_t index = 0;         // 1-based record number in the file

  // Value of a named column; empty view when the column does not exist.
  std::string_view get(std::string_view column) const;
  bool set(std::string_view column, std::string value);
};

// Result of processing one record.
struct ParseOutcome {
  enum class Kind { Success, Skipped, Fatal };

  Kind kind = Kind::Success;
  std::string reason;   // stable summary key, e.g. "missing required field"
  std::string detail;   // free text for the issue list
  StructuredRecord record;

  bool ok() const noexcept { return kind == Kind::Success; }

  static ParseOutcome success(StructuredRecord r) {
    ParseOutcome o;
    o.record = std::move(r);
    return o;
  }
  static ParseOutcome skipped(std::string reason, std::string detail = {}) {
    ParseOutcome o;
    o.kind = Kind::Skipped;
    o.reason = std::move(reason);
    o.detail = std::move(detail);
    return o;
  }
  static ParseOutcome fatal(std::string reason, std::string detail = {}) {
    ParseOutcome o;
    o.kind = Kind::Fatal;
    o.reason = std::move(reason);
    o.detail = std::move(detail);
    return o;
  }
};

const char* outcome_kind_name(ParseOutcome::Kind k) noexcept;

}
