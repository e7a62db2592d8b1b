#pragma once
#include "fec_scanner/output_sink.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace fec {

struct Schema;
struct StructuredRecord;

// True when `v` contains ',', '"', '\r' or '\n'.
bool needs_quoting(std::string_view v) noexcept;

// Appends `v` to `line`, quoted with doubled internal quotes if needed.
void append_escaped(std::string& line, std::string_view v);

// Writes one form-type stream: header line, then one line per record.
// Lines are formatted completely before they reach the buffer, so a sink
// never receives part of a record.
class CsvEmitter {
public:
  struct Config {
    std::size_t buffer_bytes = 64 * 1024; // flushed to the sink when exceeded
  };

  CsvEmitter(std::unique_ptr<OutputSink> sink, const Schema& schema, Config cfg,
             std::string filing_id = {}, bool include_filing_id = false);
  ~CsvEmitter();

  CsvEmitter(const CsvEmitter&) = delete;
  CsvEmitter& operator=(const CsvEmitter&) = delete;

  bool emit(const StructuredRecord& rec);
  bool flush();

  const Schema& schema() const noexcept { return schema_; }
  std::uint64_t rows() const noexcept { return rows_; }
  const std::string& error() const noexcept { return err_; }

private:
  bool drain();

  std::unique_ptr<OutputSink> sink_;
  const Schema& schema_;
  Config cfg_;
  std::string filing_id_;
  bool include_filing_id_;
  std::string buf_;
  std::string line_;
  std::uint64_t rows_{0};
  std::string err_;
};

// Routes records to one CsvEmitter per form-type code, opening sinks lazily.
class EmitterSet {
public:
  EmitterSet(SinkFactory factory, CsvEmitter::Config cfg,
             std::string filing_id = {}, bool include_filing_id = false);

  // False on a sink open or write failure (see error()).
  bool emit(const StructuredRecord& rec);
  bool flush_all();

  std::map<std::string, std::uint64_t> rows_by_form() const;
  std::size_t streams() const noexcept { return emitters_.size(); }
  const std::string& error() const noexcept { return err_; }

private:
  SinkFactory factory_;
  CsvEmitter::Config cfg_;
  std::string filing_id_;
  bool include_filing_id_;
  std::map<std::string, std::unique_ptr<CsvEmitter>, std::less<>> emitters_;
  std::string err_;
};

}
