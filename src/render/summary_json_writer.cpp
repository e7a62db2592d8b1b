#include "fec_scanner/summary.hpp"
#include <sstream>

namespace fec {

const char* coordinator_state_name(CoordinatorState s) noexcept {
  switch (s) {
    case CoordinatorState::Start:           return "start";
    case CoordinatorState::VersionDetected: return "version_detected";
    case CoordinatorState::Streaming:       return "streaming";
    case CoordinatorState::Done:            return "done";
  }
  return "start";
}

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          o << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static void counts(std::ostringstream& o, const std::map<std::string, std::uint64_t>& m){
  o << "{";
  bool first=true;
  for (auto& kv : m) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}";
}

std::string SummaryJsonWriter::to_json(const FileSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"filing_id\":"; esc(o, s.filing_id); o << ",";
  o << "\"version\":";   esc(o, s.version);   o << ",";
  o << "\"delimiter\":"; esc(o, s.delimiter); o << ",";
  o << "\"encoding\":";  esc(o, s.encoding);  o << ",";
  o << "\"legacy_header\":" << (s.legacy_header ? "true" : "false") << ",";
  o << "\"state\":\"" << coordinator_state_name(s.state) << "\",";
  o << "\"total_records\":" << s.total_records << ",";
  o << "\"succeeded\":" << s.succeeded << ",";
  o << "\"skipped\":" << s.skipped << ",";
  o << "\"fatal\":" << s.fatal << ",";
  o << "\"degraded_fields\":" << s.degraded_fields << ",";
  o << "\"continued_lines\":" << s.continued_lines << ",";
  o << "\"bytes_read\":" << s.bytes_read << ",";

  o << "\"skipped_by_reason\":"; counts(o, s.skipped_by_reason); o << ",";
  o << "\"fatal_by_reason\":";   counts(o, s.fatal_by_reason);   o << ",";
  o << "\"rows_by_form_type\":"; counts(o, s.rows_by_form_type); o << ",";

  o << "\"issues\":[";
  for (size_t i=0;i<s.issues.size();++i){
    if (i) o << ",";
    const auto& r = s.issues[i];
    o << "{\"record\":" << r.index << ",\"outcome\":\"" << (r.fatal ? "fatal" : "skipped") << "\",";
    o << "\"reason\":"; esc(o, r.reason); o << ",";
    o << "\"detail\":"; esc(o, r.detail); o << "}";
  }
  o << "],";
  o << "\"issues_omitted\":" << s.issues_omitted << ",";
  o << "\"cancelled\":" << (s.cancelled ? "true" : "false") << ",";
  o << "\"ok\":" << (s.ok() ? "true" : "false") << ",";
  o << "\"error\":"; esc(o, s.error);

  o << "}";
  return o.str();
}

}
