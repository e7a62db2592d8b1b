#include "fec_scanner/csv_emitter.hpp"
#include "fec_scanner/outcome.hpp"
#include "fec_scanner/schema_registry.hpp"


namespace fec {

bool needs_quoting(std::string_view v) noexcept {
  for (char c : v) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') return true;
  }
  return false;
}

void append_escaped(std::string& line, std::string_view v) {
  if (!needs_quoting(v)) { line.append(v); return; }
  line.push_back('"');
  for (char c : v) {
    if (c == '"') line.push_back('"');
    line.push_back(c);
  }
  line.push_back('"');
}

CsvEmitter::CsvEmitter(std::unique_ptr<OutputSink> sink, const Schema& schema, Config cfg,
                       std::string filing_id, bool include_filing_id)
  : sink_(std::move(sink)), schema_(schema), cfg_(cfg),
    filing_id_(std::move(filing_id)), include_filing_id_(include_filing_id) {
  buf_.reserve(cfg_.buffer_bytes);
  // header line
  if (include_filing_id_) buf_.append("filing_id,");
  for (std::size_t i = 0; i < schema_.columns.size(); ++i) {
    if (i) buf_.push_back(',');
    append_escaped(buf_, schema_.columns[i].name);
  }
  buf_.push_back('\n');
}

CsvEmitter::~CsvEmitter() {
  if (!buf_.empty() && err_.empty()) (void)flush();
}

bool CsvEmitter::drain() {
  if (buf_.empty()) return true;
  if (!sink_->write(buf_)) {
    err_ = sink_->error().empty() ? std::string("sink write failed") : sink_->error();
    return false;
  }
  buf_.clear();
  return true;
}

bool CsvEmitter::emit(const StructuredRecord& rec) {
  if (!err_.empty()) return false;
  line_.clear();
  if (include_filing_id_) {
    append_escaped(line_, filing_id_);
    line_.push_back(',');
  }
  const std::size_t n = schema_.columns.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (i) line_.push_back(',');
    if (i < rec.values.size()) append_escaped(line_, rec.values[i]);
  }
  line_.push_back('\n');

  if (buf_.size() + line_.size() > cfg_.buffer_bytes && !drain()) return false;
  if (line_.size() > cfg_.buffer_bytes) {
    if (!sink_->write(line_)) {
      err_ = sink_->error().empty() ? std::string("sink write failed") : sink_->error();
      return false;
    }
  } else {
    buf_.append(line_);
  }
  ++rows_;
  return true;
}

bool CsvEmitter::flush() {
  if (!drain()) return false;
  if (!sink_->flush()) {
    err_ = sink_->error().empty() ? std::string("sink flush failed") : sink_->error();
    return false;
  }
  return true;
}

EmitterSet::EmitterSet(SinkFactory factory, CsvEmitter::Config cfg,
                       std::string filing_id, bool include_filing_id)
  : factory_(std::move(factory)), cfg_(cfg),
    filing_id_(std::move(filing_id)), include_filing_id_(include_filing_id) {}

bool EmitterSet::emit(const StructuredRecord& rec) {
  auto it = emitters_.find(rec.form_type);
  if (it == emitters_.end()) {
    std::string err;
    auto sink = factory_ ? factory_(rec.form_type, err) : nullptr;
    if (!sink) {
      err_ = "cannot open stream " + rec.form_type + (err.empty() ? std::string() : ": " + err);
      return false;
    }
    auto em = std::make_unique<CsvEmitter>(std::move(sink), *rec.schema, cfg_, filing_id_, include_filing_id_);
    it = emitters_.emplace(rec.form_type, std::move(em)).first;
  }
  if (!it->second->emit(rec)) {
    err_ = it->second->error();
    return false;
  }
  return true;
}

bool EmitterSet::flush_all() {
  bool ok = true;
  for (auto& kv : emitters_) {
    if (!kv.second->flush()) {
      if (ok) err_ = kv.second->error();
      ok = false;
    }
  }
  return ok;
}

std::map<std::string, std::uint64_t> EmitterSet::rows_by_form() const {
  std::map<std::string, std::uint64_t> out;
  for (const auto& kv : emitters_) out[kv.first] = kv.second->rows();
  return out;
}

}
