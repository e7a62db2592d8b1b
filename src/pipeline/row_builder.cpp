#include "fec_scanner/row_builder.hpp"
#include "fec_scanner/classifier.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/tokenizer.hpp"

#include <cctype>

namespace fec {

static std::string show_raw(std::string_view raw) {
  constexpr std::size_t kMax = 64;
  std::string s = normalize(raw.substr(0, kMax), EncodingMode::Sniff);
  if (raw.size() > kMax) s += "...";
  return s;
}

std::string RowBuilder::default_value(const ColumnSpec& col) {
  switch (col.kind) {
    case ColumnKind::Integer:
    case ColumnKind::Decimal: return "0";
    case ColumnKind::Boolean: return "false";
    default:                  return {};
  }
}

std::string RowBuilder::text(std::string_view raw) {
  std::string out;
  std::size_t d = normalize_into(raw, mode_, out);
  if (d) ++degraded_;
  return out;
}

bool RowBuilder::convert(const ColumnSpec& col, std::string_view raw, std::string& out) {
  out.clear();
  if (col.kind == ColumnKind::Text) {
    if (normalize_into(raw, mode_, out)) ++degraded_;
    return true;
  }

  std::string_view v = trim(raw);
  if (v.empty()) return true; // explicit null

  switch (col.kind) {
    case ColumnKind::Integer:
      if (!policy_.parse_integer(v)) return false;
      out.assign(v.data(), v.size());
      return true;
    case ColumnKind::Decimal:
      if (!policy_.parse_decimal(v)) return false;
      out.assign(v.data(), v.size());
      return true;
    case ColumnKind::Date: {
      auto d = policy_.parse_date(v);
      if (!d) return false;
      out = std::move(*d);
      return true;
    }
    case ColumnKind::Boolean: {
      auto b = policy_.parse_bool(v);
      if (!b) return false;
      out = *b ? "true" : "false";
      return true;
    }
    case ColumnKind::Enumerated: {
      if (normalize_into(v, mode_, out)) ++degraded_;
      for (auto& c : out) c = static_cast<char>(std::toupper((unsigned char)c));
      if (col.allowed.empty()) return true;
      for (const auto& a : col.allowed) if (iequals(out, a)) return true;
      out.clear();
      return false;
    }
    case ColumnKind::Text:
      break;
  }
  return true;
}

ParseOutcome RowBuilder::build(Tokenizer& tok, const Classification& cls, std::uint64_t index) {
  const Schema& schema = *cls.schema;
  StructuredRecord rec;
  rec.form_type = cls.form_type;
  rec.schema = &schema;
  rec.index = index;
  rec.values.reserve(schema.size());
  rec.values.push_back(text(cls.code));

  Token t;
  std::string value;
  for (std::size_t i = 1; i < schema.size(); ++i) {
    const ColumnSpec& col = schema.columns[i];
    if (!tok.next(t)) {
      if (tok.failed())
        return ParseOutcome::fatal(std::string(tok.reason()),
                                   "column " + col.name + " (position " + std::to_string(i) + ")");
      for (std::size_t j = i; j < schema.size(); ++j) {
        const ColumnSpec& missing = schema.columns[j];
        if (missing.required)
          return ParseOutcome::skipped("missing required field",
                                       missing.name + " (position " + std::to_string(j) + ")");
        rec.values.push_back(default_value(missing));
      }
      return ParseOutcome::success(std::move(rec));
    }

    if (!convert(col, t.text, value)) {
      return ParseOutcome::skipped(std::string("invalid ") + column_kind_name(col.kind),
                                   col.name + ": '" + show_raw(t.text) + "'");
    }
    rec.values.push_back(std::move(value));
    value = std::string();
  }

  // over-read: extra trailing tokens are dropped, but must still be well formed
  if (!tok.drain())
    return ParseOutcome::fatal(std::string(tok.reason()), "after column " + std::to_string(schema.size() - 1));
  return ParseOutcome::success(std::move(rec));
}

}
