#pragma once
#include "fec_scanner/csv_emitter.hpp"
#include "fec_scanner/encoding.hpp"
#include "fec_scanner/filing_version.hpp"
#include "fec_scanner/output_sink.hpp"
#include "fec_scanner/parse_policy.hpp"
#include "fec_scanner/record_reader.hpp"
#include "fec_scanner/summary.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fec {

class ByteSource;
class SchemaRegistry;

using WarnCallback = std::function<void(std::string_view)>;

// Drives one filing through reader -> tokenizer -> classifier -> row builder
// -> emitters. One instance per file; instances share only the (frozen)
// registry.
class StreamCoordinator {
public:
  struct Config {
    // Absent values are detected from the header record.
    std::optional<FilingVersion> version_override;
    std::optional<EncodingMode>  encoding_override;
    std::optional<char>          delimiter_override; // field separator byte

    char        quote             = '"';     // '\0' disables quoting
    std::string filing_id;                   // value of the filing_id column
    bool        include_filing_id = false;
    bool        emit_header       = true;    // write the header to the HDR stream
    std::size_t max_issue_details = 1000;    // per-record issues kept in the summary
    bool        warn_records      = true;    // pass per-record issues to the warn callback
    std::size_t max_quoted_lines  = 64;      // physical lines a quoted field may continue over

    RecordReader::Config reader;
    CsvEmitter::Config   emitter;
    ParsePolicy          policy;
  };

  StreamCoordinator(const SchemaRegistry& registry, ByteSource& source, SinkFactory sinks);
  StreamCoordinator(const SchemaRegistry& registry, ByteSource& source, SinkFactory sinks, Config cfg);
  ~StreamCoordinator();

  StreamCoordinator(const StreamCoordinator&) = delete;
  StreamCoordinator& operator=(const StreamCoordinator&) = delete;

  // Per-record issues and file-level notes (version, delimiter, encoding).
  void set_warn_callback(WarnCallback cb);

  // Processes the whole file. False on a file-level failure (unreadable or
  // unparseable header, unknown version, source or sink failure); the
  // summary still describes how far processing got. Call once.
  bool run();

  // Ask run() to stop before the next record. Safe from any thread.
  void request_stop() noexcept;

  CoordinatorState state() const noexcept;
  const FileSummary& summary() const noexcept;
  const std::string& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
