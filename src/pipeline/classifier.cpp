#include "fec_scanner/classifier.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/tokenizer.hpp"
#include "fec_scanner/parse_policy.hpp"

#include <cctype>

namespace fec {

bool RecordClassifier::fail(std::string reason, std::string detail, bool malformed) {
  reason_ = std::move(reason);
  detail_ = std::move(detail);
  malformed_ = malformed;
  return false;
}

bool RecordClassifier::classify(Tokenizer& tok, Classification& out) {
  Token t;
  if (!tok.next(t)) {
    if (tok.failed())
      return fail(std::string(tok.reason()), "form type column", true);
    return fail("empty form type", "record has no fields");
  }

  std::string_view code = trim(t.text);
  if (code.empty()) return fail("empty form type", "column 0 is blank");

  out.code.assign(code.data(), code.size());
  out.form_type.clear();
  out.form_type.reserve(code.size());
  for (char c : code) out.form_type.push_back(static_cast<char>(std::toupper((unsigned char)c)));

  auto family = registry_.family_of(out.form_type);
  if (!family) return fail("unknown form type", "code '" + out.code + "'");

  out.schema = registry_.resolve(version_, *family);
  if (!out.schema)
    return fail("no schema for version",
                std::string(*family) + " has no layout at or before " + version_.str());
  return true;
}

}
