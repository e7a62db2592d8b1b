#pragma once
#include "fec_scanner/filing_version.hpp"

#include <string>

namespace fec {

class SchemaRegistry;
class Tokenizer;
struct Schema;

struct Classification {
  std::string form_type;         // upper-cased code, e.g. "SA11AI"
  std::string code;              // code as written (trimmed)
  const Schema* schema = nullptr;
};

// Reads the form-type code from column 0 and resolves its schema for the
// file's version. Only the first token is pulled, so an unknown code stops
// the record without scanning the rest of it.
class RecordClassifier {
public:
  RecordClassifier(const SchemaRegistry& registry, FilingVersion version)
    : registry_(registry), version_(version) {}

  bool classify(Tokenizer& tok, Classification& out);

  // Summary key and detail of the last failure.
  const std::string& reason() const noexcept { return reason_; }
  const std::string& detail() const noexcept { return detail_; }

  // True when the last failure came from the tokenizer (malformed quoting).
  bool malformed() const noexcept { return malformed_; }

private:
  bool fail(std::string reason, std::string detail, bool malformed = false);

  const SchemaRegistry& registry_;
  FilingVersion version_;
  std::string reason_;
  std::string detail_;
  bool malformed_{false};
};

}
