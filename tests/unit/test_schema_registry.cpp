#include "fec_scanner/schema_registry.hpp"
#include "test_support.hpp"

#include <stdexcept>

using fec::ColumnKind;
using fec::ColumnSpec;
using fec::FilingVersion;

static ColumnSpec c(const char* name, ColumnKind k = ColumnKind::Text, bool required = false) {
  ColumnSpec s;
  s.name = name;
  s.kind = k;
  s.required = required;
  return s;
}

int main() {
  fec_test::Checker t;

  // --- versions
  auto v = FilingVersion::parse("8.3");
  t.expect(v && v->major == 8 && v->minor == 3, "parse 8.3");
  v = FilingVersion::parse(" 5.00 ");
  t.expect(v && *v == FilingVersion(5, 0), "parse 5.00 with spaces");
  v = FilingVersion::parse("v6");
  t.expect(v && *v == FilingVersion(6, 0), "parse v6");
  t.expect(!FilingVersion::parse(""), "reject empty version");
  t.expect(!FilingVersion::parse("eight"), "reject non-numeric version");
  t.expect(!FilingVersion::parse("8.x"), "reject bad minor");
  t.expect(FilingVersion(8, 2) > FilingVersion(8, 0), "8.2 > 8.0");
  t.expect(FilingVersion(7, 9) < FilingVersion(8, 0), "7.9 < 8.0");
  t.expect_eq(FilingVersion(8, 3).str(), "8.3", "version str");

  // --- resolve with fallback
  fec::SchemaRegistry r;
  r.add({8, 0}, "SA", {c("form_type", ColumnKind::Text, true), c("amount", ColumnKind::Decimal)},
        fec::CodeRule::LineNumber);
  r.add({6, 1}, "SA", {c("form_type", ColumnKind::Text, true), c("old_amount", ColumnKind::Decimal), c("purpose")},
        fec::CodeRule::LineNumber);
  r.add({8, 3}, "sb", {c("form_type"), c("payee")});

  const fec::Schema* s = r.resolve({8, 2}, "SA");
  t.expect(s && s->version == FilingVersion(8, 0), "resolve(8.2, SA) falls back to 8.0");
  s = r.resolve({8, 0}, "SA");
  t.expect(s && s->version == FilingVersion(8, 0), "exact match 8.0");
  s = r.resolve({7, 0}, "SA");
  t.expect(s && s->version == FilingVersion(6, 1) && s->size() == 3, "resolve(7.0, SA) -> 6.1");
  t.expect(r.resolve({5, 0}, "SA") == nullptr, "no SA layout at or before 5.0");
  t.expect(r.resolve({8, 3}, "F3") == nullptr, "unknown family is NotFound");
  t.expect(r.resolve({9, 0}, "SB") != nullptr, "form type stored upper-cased");

  s = r.resolve({8, 0}, "SA");
  t.expect(s && s->columns[1].position == 1 && s->index_of("amount") == std::optional<std::size_t>(1),
           "positions assigned in order");
  t.expect(s && !s->index_of("nope"), "index_of missing column");

  // --- families
  auto fam = r.family_of("SA11AI");
  t.expect(fam && *fam == "SA", "SA11AI belongs to SA");
  t.expect(!r.family_of("F3X"), "F3X has no family here");
  t.expect(!r.family_of("SAXYZ"), "SA needs a line number");
  t.expect(!r.family_of("SAN"), "line-numbered family takes no amendment suffix");
  auto sb = r.family_of("SBA");
  t.expect(sb && *sb == "SB", "SB amends with A");
  t.expect(!r.family_of("SB23"), "SB here has no line numbers");
  t.expect(!r.family_of(""), "empty code");
  auto vs = r.versions_for("SA");
  t.expect(vs.size() == 2 && vs[0] == FilingVersion(6, 1) && vs[1] == FilingVersion(8, 0), "versions ascending");
  t.expect(r.covers({6, 1}) && !r.covers({6, 0}), "covers");
  t.expect_num(r.size(), 3, "three layouts registered");

  // --- bad registrations
  bool threw = false;
  try { r.add({8, 0}, "SA", {c("x")}, fec::CodeRule::LineNumber); } catch (const std::invalid_argument&) { threw = true; }
  t.expect(threw, "duplicate key rejected");
  threw = false;
  try { r.add({9, 0}, "SA", {c("x"), c("x")}); } catch (const std::invalid_argument&) { threw = true; }
  t.expect(threw, "duplicate column rejected");
  threw = false;
  try { r.add({9, 0}, "SA", {}); } catch (const std::invalid_argument&) { threw = true; }
  t.expect(threw, "empty column list rejected");
  threw = false;
  try { r.add({9, 0}, "SA", {c("x")}); } catch (const std::invalid_argument&) { threw = true; }
  t.expect(threw, "code rule change rejected");

  r.freeze();
  threw = false;
  try { r.add({9, 0}, "SC", {c("x")}); } catch (const std::logic_error&) { threw = true; }
  t.expect(threw && r.frozen(), "frozen registry rejects add");

  // --- shipped layouts
  fec::SchemaRegistry b;
  fec::register_builtin_schemas(b);
  const char* families[] = {"HDR", "F3", "F3X", "F99", "SA", "SB", "TEXT"};
  for (auto f : families) t.expect(b.resolve({8, 3}, f) != nullptr, std::string("builtin ") + f + " at 8.3");
  auto f3x = b.family_of("F3XN");
  t.expect(f3x && *f3x == "F3X", "F3XN -> F3X");
  auto f3 = b.family_of("F3A");
  t.expect(f3 && *f3 == "F3", "F3A -> F3");
  const char* unknown[] = {"F3P", "F3PN", "F3L", "F3S", "F3Z1", "F3XZ", "SAXYZ", "F99N1", "HDRX"};
  for (auto u : unknown) t.expect(!b.family_of(u), std::string(u) + " has no shipped family");
  auto sb23 = b.family_of("SB23");
  t.expect(sb23 && *sb23 == "SB", "SB23 -> SB");
  const fec::Schema* sa80 = b.resolve({8, 3}, "SA");
  const fec::Schema* sa61 = b.resolve({7, 0}, "SA");
  t.expect(sa80 && sa61 && sa80->version == FilingVersion(8, 0) && sa61->version == FilingVersion(6, 1),
           "SA 8.3 -> 8.0, 7.0 -> 6.1");
  t.expect(sa61 && sa61->index_of("contribution_purpose_code") && sa80 && !sa80->index_of("contribution_purpose_code"),
           "8.0 SA drops the purpose code");
  const fec::Schema* sa1 = b.resolve({3, 0}, "SA");
  t.expect(sa1 && sa1->version == FilingVersion(1, 0), "comma-era SA at 3.0");
  t.expect(b.resolve({8, 3}, "F99")->columns.back().name == "text", "F99 ends with text");

  return t.finish("schema_registry");
}
