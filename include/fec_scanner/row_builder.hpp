#pragma once
#include "fec_scanner/encoding.hpp"
#include "fec_scanner/outcome.hpp"
#include "fec_scanner/parse_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace fec {

class Tokenizer;
struct ColumnSpec;
struct Classification;

// Zips the remaining tokens of a classified record against its schema.
//
//   fewer tokens than columns -> kind defaults, unless a missing column is required
//   more tokens than columns  -> extras dropped
//   conversion failure        -> Skipped, "invalid <kind>"
//   quoting failure           -> Fatal
class RowBuilder {
public:
  RowBuilder(ParsePolicy policy, EncodingMode mode)
    : policy_(std::move(policy)), mode_(mode) {}

  // `tok` must have produced exactly the form-type token.
  ParseOutcome build(Tokenizer& tok, const Classification& cls, std::uint64_t index);

  // Converts one raw value for `col` into `out`. False on conversion failure.
  bool convert(const ColumnSpec& col, std::string_view raw, std::string& out);

  // Text normalized with the active encoding, counting degraded characters.
  std::string text(std::string_view raw);

  void set_encoding(EncodingMode mode) noexcept { mode_ = mode; }
  EncodingMode encoding() const noexcept { return mode_; }

  std::uint64_t degraded_fields() const noexcept { return degraded_; }

  static std::string default_value(const ColumnSpec& col);

private:
  ParsePolicy policy_;
  EncodingMode mode_;
  std::uint64_t degraded_{0};
};

}
