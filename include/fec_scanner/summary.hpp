#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fec {

enum class CoordinatorState { Start, VersionDetected, Streaming, Done };

const char* coordinator_state_name(CoordinatorState s) noexcept;

// One record that did not reach an output stream.
struct RecordIssue {
  std::uint64_t index = 0; // 1-based record number
  std::string reason;
  std::string detail;
  bool fatal = false;      // record-level Fatal (vs Skipped)
};

// Per-file accounting. A file that failed at the header still yields a
// summary: zero records and `error` set.
struct FileSummary {
  std::string filing_id;
  std::string version;     // as resolved, "8.3"; empty when undetected
  std::string delimiter;   // "fs", "comma", ...
  std::string encoding;
  bool legacy_header = false;
  CoordinatorState state = CoordinatorState::Start;

  std::uint64_t total_records = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t skipped = 0;
  std::uint64_t fatal = 0;
  std::uint64_t degraded_fields = 0;
  std::uint64_t continued_lines = 0; // physical lines joined into a quoted field
  std::uint64_t bytes_read = 0;

  std::map<std::string, std::uint64_t> skipped_by_reason;
  std::map<std::string, std::uint64_t> fatal_by_reason;
  std::map<std::string, std::uint64_t> rows_by_form_type;

  std::vector<RecordIssue> issues;   // capped, see issues_omitted
  std::uint64_t issues_omitted = 0;

  bool cancelled = false;
  std::string error;                 // FatalFile message

  bool ok() const noexcept { return error.empty(); }
};

class SummaryJsonWriter {
public:
  // Serialize the summary to a JSON object. Maps are emitted in key order.
  static std::string to_json(const FileSummary& s);
};

}
