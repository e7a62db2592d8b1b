#include "fec_scanner/classifier.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/tokenizer.hpp"
#include "test_support.hpp"

#include <string>

struct Probe {
  fec::RecordClassifier classifier;
  fec::Classification cls;

  Probe(const fec::SchemaRegistry& r, fec::FilingVersion v) : classifier(r, v) {}

  bool run(std::string rec) {
    fec::Tokenizer tok(rec.data(), rec.size(), ',');
    cls = fec::Classification{};
    return classifier.classify(tok, cls);
  }
};

int main() {
  fec_test::Checker t;
  fec::SchemaRegistry r;
  fec::register_builtin_schemas(r);
  r.freeze();

  Probe p83(r, {8, 3});
  Probe p50(r, {5, 0});

  t.expect(p83.run("SA11AI,C001,T-1"), "SA11AI classifies");
  t.expect_eq(p83.cls.form_type, "SA11AI", "form type kept whole");
  t.expect(p83.cls.schema && p83.cls.schema->form_type == "SA" &&
           p83.cls.schema->version == fec::FilingVersion(8, 0), "SA11AI -> SA 8.0 at 8.3");

  t.expect(p83.run(" sb17 ,C001"), "lower case with spaces");
  t.expect_eq(p83.cls.form_type, "SB17", "code upper-cased and trimmed");
  t.expect_eq(p83.cls.code, "sb17", "code as written");

  t.expect(p50.run("F3XN,C001"), "F3XN in 5.0");
  t.expect(p50.cls.schema && p50.cls.schema->form_type == "F3X" &&
           p50.cls.schema->version == fec::FilingVersion(1, 0), "F3XN -> F3X 1.0");

  t.expect(!p83.run("ZZ9,C001"), "unknown code fails");
  t.expect_eq(p83.classifier.reason(), "unknown form type", "unknown reason");
  t.expect_eq(p83.classifier.detail(), "code 'ZZ9'", "unknown detail");
  t.expect(!p83.classifier.malformed(), "unknown is not malformed");

  // codes with their own FEC layouts must not borrow a shorter family's columns
  const char* foreign[] = {"F3PN", "F3L", "F3S", "F3Z1", "SAXYZ"};
  for (auto code : foreign) {
    t.expect(!p83.run(std::string(code) + ",C001"), std::string(code) + " is not classified");
    t.expect_eq(p83.classifier.reason(), "unknown form type", std::string(code) + " reason");
    t.expect(p83.cls.schema == nullptr, std::string(code) + " has no schema");
  }
  t.expect(p83.run("F3A,C001"), "F3A is an amended F3");
  t.expect(p83.cls.schema && p83.cls.schema->form_type == "F3", "F3A -> F3");
  t.expect(p83.run("SB23,C001"), "SB23 classifies");
  t.expect(p83.cls.schema && p83.cls.schema->form_type == "SB", "SB23 -> SB");

  t.expect(!p83.run(",C001"), "blank code fails");
  t.expect_eq(p83.classifier.reason(), "empty form type", "blank reason");

  t.expect(!p83.run("\"SA11AI,C001"), "unterminated quote in code");
  t.expect(p83.classifier.malformed(), "malformed flag");
  t.expect_eq(p83.classifier.reason(), "unterminated quoted field", "tokenizer reason passed through");

  // a family registered only above the file's version
  fec::SchemaRegistry late;
  fec::ColumnSpec col;
  col.name = "form_type";
  late.add({9, 0}, "SE", {col});
  late.freeze();
  Probe early(late, {8, 3});
  t.expect(!early.run("SE,C001"), "no layout at or before 8.3");
  t.expect_eq(early.classifier.reason(), "no schema for version", "no schema reason");

  return t.finish("classifier");
}
