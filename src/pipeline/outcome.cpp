#include "fec_scanner/outcome.hpp"
#include "fec_scanner/schema_registry.hpp"

namespace fec {

std::string_view StructuredRecord::get(std::string_view column) const {
  if (!schema) return {};
  auto i = schema->index_of(column);
  if (!i || *i >= values.size()) return {};
  return values[*i];
}

bool StructuredRecord::set(std::string_view column, std::string value) {
  if (!schema) return false;
  auto i = schema->index_of(column);
  if (!i || *i >= values.size()) return false;
  values[*i] = std::move(value);
  return true;
}

const char* outcome_kind_name(ParseOutcome::Kind k) noexcept {
  switch (k) {
    case ParseOutcome::Kind::Success: return "success";
    case ParseOutcome::Kind::Skipped: return "skipped";
    case ParseOutcome::Kind::Fatal:   return "fatal";
  }
  return "success";
}

}
