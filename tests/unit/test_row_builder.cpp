#include "fec_scanner/classifier.hpp"
#include "fec_scanner/date_parse.hpp"
#include "fec_scanner/parse_policy.hpp"
#include "fec_scanner/row_builder.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/tokenizer.hpp"
#include "test_support.hpp"

#include <string>

using fec::ColumnKind;
using fec::ColumnSpec;

static ColumnSpec c(const char* name, ColumnKind k = ColumnKind::Text, bool required = false) {
  ColumnSpec s;
  s.name = name;
  s.kind = k;
  s.required = required;
  return s;
}

// SX: form_type, id (required), amount, date, memo, count, entity, note
static fec::SchemaRegistry make_registry() {
  fec::SchemaRegistry r;
  ColumnSpec entity = c("entity", ColumnKind::Enumerated);
  entity.allowed = {"IND", "ORG"};
  r.add({8, 0}, "SX", {c("form_type", ColumnKind::Text, true), c("id", ColumnKind::Text, true),
                       c("amount", ColumnKind::Decimal), c("date", ColumnKind::Date),
                       c("memo", ColumnKind::Boolean), c("count", ColumnKind::Integer),
                       entity, c("note")}, fec::CodeRule::LineNumber);
  r.freeze();
  return r;
}

static fec::ParseOutcome build(const fec::SchemaRegistry& r, fec::RowBuilder& b, std::string rec) {
  fec::Tokenizer tok(rec.data(), rec.size(), ',');
  fec::RecordClassifier cl(r, {8, 3});
  fec::Classification cls;
  if (!cl.classify(tok, cls)) return fec::ParseOutcome::fatal(cl.reason(), cl.detail());
  return b.build(tok, cls, 42);
}

int main() {
  fec_test::Checker t;
  const fec::SchemaRegistry r = make_registry();
  fec::RowBuilder b(fec::ParsePolicy{}, fec::EncodingMode::Utf8);

  // --- full row, typed conversions
  auto o = build(r, b, "sx1,C001, 1234.50 ,20240131,x,+7,org,hello");
  t.expect(o.ok(), "full row succeeds: " + o.reason + " " + o.detail);
  t.expect_num(o.record.values.size(), 8, "one value per column");
  t.expect_num(o.record.index, 42, "record index kept");
  t.expect_eq(o.record.form_type, "SX1", "form type upper-cased");
  t.expect_eq(o.record.values[0], "sx1", "column 0 keeps the code as written");
  t.expect_eq(o.record.get("amount"), "1234.50", "decimal trimmed, text kept");
  t.expect_eq(o.record.get("date"), "2024-01-31", "date in ISO form");
  t.expect_eq(o.record.get("memo"), "true", "X is true");
  t.expect_eq(o.record.get("count"), "+7", "integer as written");
  t.expect_eq(o.record.get("entity"), "ORG", "enum upper-cased");
  t.expect_eq(o.record.get("note"), "hello", "text");

  // --- under-read: optional columns take their defaults
  o = build(r, b, "SX,C001");
  t.expect(o.ok(), "short row with optional tail succeeds");
  t.expect(o.ok() && o.record.values.size() == 8, "short row padded to schema width");
  t.expect_eq(o.record.get("amount"), "0", "decimal default");
  t.expect_eq(o.record.get("memo"), "false", "boolean default");
  t.expect_eq(o.record.get("date"), "", "date default empty");

  // --- missing required field
  o = build(r, b, "SX");
  t.expect(o.kind == fec::ParseOutcome::Kind::Skipped, "missing required is Skipped");
  t.expect_eq(o.reason, "missing required field", "missing required reason");
  t.expect_eq(o.detail, "id (position 1)", "names the column");

  // required but empty is present
  o = build(r, b, "SX,");
  t.expect(o.ok() && o.record.get("id").empty(), "empty required value is allowed");

  // --- over-read: extras dropped
  o = build(r, b, "SX,C001,1,20240101,N,1,IND,note,extra1,extra2");
  t.expect(o.ok() && o.record.values.size() == 8, "extra tokens dropped");
  t.expect_eq(o.record.get("note"), "note", "last real column intact");

  // --- conversion failures
  o = build(r, b, "SX,C001,12abc");
  t.expect(o.kind == fec::ParseOutcome::Kind::Skipped && o.reason == "invalid decimal", "bad decimal");
  t.expect_eq(o.detail, "amount: '12abc'", "bad decimal detail");
  o = build(r, b, "SX,C001,1,20240230");
  t.expect(o.reason == "invalid date", "Feb 30 rejected");
  o = build(r, b, "SX,C001,1,20240101,maybe");
  t.expect(o.reason == "invalid boolean", "bad boolean");
  o = build(r, b, "SX,C001,1,20240101,N,1.5");
  t.expect(o.reason == "invalid integer", "bad integer");
  o = build(r, b, "SX,C001,1,20240101,N,1,PAC");
  t.expect(o.reason == "invalid enumerated", "value outside enum");
  o = build(r, b, "SX,C001,nan");
  t.expect(o.reason == "invalid decimal", "nan rejected");
  o = build(r, b, "SX,C001,,,,,");
  t.expect(o.ok() && o.record.get("amount").empty() && o.record.get("entity").empty(),
           "empty typed values stay empty");

  // --- malformed quoting is Fatal, even past the last column
  o = build(r, b, "SX,C001,\"1.00");
  t.expect(o.kind == fec::ParseOutcome::Kind::Fatal && o.reason == "unterminated quoted field",
           "unterminated quote in a column");
  o = build(r, b, "SX,C001,1,20240101,N,1,IND,note,\"bad\"x");
  t.expect(o.kind == fec::ParseOutcome::Kind::Fatal && o.reason == "text after closing quote",
           "malformed extra token");

  // --- encodings
  {
    fec::RowBuilder w(fec::ParsePolicy{}, fec::EncodingMode::Windows1252);
    o = build(r, w, "SX,C001,,,,,,JOS\xC9");
    t.expect_eq(o.record.get("note"), "JOS\xC3\x89", "windows-1252 transcoded");
    t.expect_num(w.degraded_fields(), 0, "no degraded fields");
    o = build(r, w, "SX,C001,,,,,,a\x81\x8D");
    t.expect_eq(o.record.get("note"), "a\xEF\xBF\xBD\xEF\xBF\xBD", "undefined bytes become placeholders");
    t.expect_num(w.degraded_fields(), 1, "a field counts once");

    fec::RowBuilder u(fec::ParsePolicy{}, fec::EncodingMode::Utf8);
    o = build(r, u, "SX,C\xFF" "01");
    t.expect(o.ok(), "invalid utf-8 does not fail the record");
    t.expect_num(u.degraded_fields(), 1, "utf-8 degraded field counted");
    u.set_encoding(fec::EncodingMode::Sniff);
    t.expect(u.encoding() == fec::EncodingMode::Sniff, "set_encoding");
  }

  // --- custom boolean tokens
  {
    fec::ParsePolicy p;
    p.bool_policy.true_tokens = {"SI"};
    p.bool_policy.false_tokens = {"NO"};
    fec::RowBuilder custom(p, fec::EncodingMode::Utf8);
    o = build(r, custom, "SX,C001,1,20240101,si");
    t.expect(o.ok() && o.record.get("memo") == "true", "custom true token");
    o = build(r, custom, "SX,C001,1,20240101,X");
    t.expect(o.reason == "invalid boolean", "default token no longer accepted");
  }

  // --- policy helpers
  {
    fec::ParsePolicy p;
    t.expect(p.parse_integer("-12") == std::int64_t(-12), "negative integer");
    t.expect(!p.parse_integer("12 "), "trailing space is not an integer");
    t.expect(p.parse_decimal("-0.5") && *p.parse_decimal("-0.5") == -0.5, "negative decimal");
    t.expect(!p.parse_decimal("1e999"), "overflow rejected");
    t.expect(!p.parse_decimal("inf"), "infinity rejected");
    t.expect(p.parse_bool("yes") == true && p.parse_bool("n") == false, "bool tokens case-insensitive");
    t.expect_eq(fec::trim("\t x \t"), "x", "trim");

    auto d = fec::parse_filing_date("2/29/2024");
    t.expect(d && d->year == 2024 && d->month == 2 && d->day == 29, "slash date leap day");
    t.expect(!fec::parse_filing_date("2/29/2023"), "not a leap year");
    t.expect(!fec::parse_filing_date("2023-13-01"), "month 13");
    t.expect(!fec::parse_filing_date("1900-02-29"), "1900 not leap");
    t.expect(fec::parse_filing_date("2000-02-29").has_value(), "2000 leap");
    t.expect_eq(fec::format_iso_date({1999, 7, 4}), "1999-07-04", "iso format");
  }

  return t.finish("row_builder");
}
