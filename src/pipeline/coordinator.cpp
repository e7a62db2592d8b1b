#include "fec_scanner/coordinator.hpp"
#include "fec_scanner/byte_source.hpp"
#include "fec_scanner/classifier.hpp"
#include "fec_scanner/header.hpp"
#include "fec_scanner/raw_record.hpp"
#include "fec_scanner/row_builder.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/tokenizer.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace fec {

static bool is_blank(std::string_view s) {
  for (char c : s) if (c != ' ' && c != '\t' && c != '\r') return false;
  return true;
}

struct StreamCoordinator::Impl {
  const SchemaRegistry& registry;
  ByteSource& src;
  SinkFactory sinks;
  Config cfg;
  WarnCallback warn;

  std::atomic<bool> stop{false};
  std::atomic<CoordinatorState> state{CoordinatorState::Start};
  bool ran{false};

  FileSummary sum;
  std::string err;

  RecordReader reader;
  RawRecord rec{4096};
  RawRecord cont{4096};

  // lines read ahead while looking for a closing quote, served before the reader
  struct Held {
    RecordReader::Status status;
    std::string bytes;
    std::uint64_t index;
    std::uint64_t offset;
  };
  std::deque<Held> replay;

  FilingVersion version;
  char delim{kCommaDelimiter};
  EncodingMode enc{EncodingMode::Utf8};
  std::unique_ptr<RecordClassifier> classifier;
  std::unique_ptr<RowBuilder> builder;
  std::unique_ptr<EmitterSet> emitters;

  // F99 record waiting for its optional [BEGINTEXT] block
  std::optional<StructuredRecord> pending;
  bool in_text{false};
  bool text_orphan{false};
  bool text_has_line{false};
  std::uint64_t text_index{0};
  std::string text_buf;

  Impl(const SchemaRegistry& r, ByteSource& s, SinkFactory f, Config c)
    : registry(r), src(s), sinks(std::move(f)), cfg(std::move(c)), reader(s, cfg.reader) {
    sum.filing_id = cfg.filing_id;
  }

  void note(const std::string& msg) { if (warn) warn(msg); }

  void set_state(CoordinatorState s) {
    state.store(s);
    sum.state = s;
  }

  bool fail_file(std::string msg) {
    if (err.empty()) {
      err = std::move(msg);
      sum.error = err;
      note("fatal: " + err);
    }
    return false;
  }

  void issue(std::uint64_t index, const ParseOutcome& o) {
    ++sum.total_records;
    const bool fatal = o.kind == ParseOutcome::Kind::Fatal;
    if (fatal) { ++sum.fatal; ++sum.fatal_by_reason[o.reason]; }
    else       { ++sum.skipped; ++sum.skipped_by_reason[o.reason]; }

    if (sum.issues.size() < cfg.max_issue_details) sum.issues.push_back({index, o.reason, o.detail, fatal});
    else ++sum.issues_omitted;

    if (warn && cfg.warn_records) {
      std::string msg = "record " + std::to_string(index) + ": " + o.reason;
      if (!o.detail.empty()) msg += " (" + o.detail + ")";
      warn(msg);
    }
  }

  bool deliver(const StructuredRecord& r) {
    ++sum.total_records;
    if (!emitters->emit(r)) return fail_file(emitters->error());
    ++sum.succeeded;
    return true;
  }

  bool flush_pending() {
    if (!pending) return true;
    StructuredRecord r = std::move(*pending);
    pending.reset();
    return deliver(r);
  }

  RecordReader::Status pull(RawRecord& out) {
    if (replay.empty()) return reader.next(out);
    Held h = std::move(replay.front());
    replay.pop_front();
    out.assign(h.bytes, h.index, h.offset);
    return h.status;
  }

  // A quoted field may hold newlines. Joins the following lines onto `r`
  // until the quote closes. When it does not close within max_quoted_lines
  // or the size limit, the lines go back to be read as records of their own.
  void join_quoted_lines(RawRecord& r) {
    std::string joined(r.view());
    std::vector<Held> taken;
    for (std::size_t n = 0; n < cfg.max_quoted_lines; ++n) {
      const RecordReader::Status st = pull(cont);
      // End and Error repeat on the next read
      if (st == RecordReader::Status::End || st == RecordReader::Status::Error) break;
      taken.push_back({st, std::string(cont.view()), cont.index(), cont.offset()});
      if (st != RecordReader::Status::Record) break;
      if (joined.size() + 1 + cont.size() > cfg.reader.max_record_bytes) break;
      joined.push_back('\n');
      joined.append(cont.view());
      if (!ends_in_open_quote(joined, delim, cfg.quote)) {
        r.assign(joined, r.index(), r.offset());
        sum.continued_lines += taken.size();
        return;
      }
    }
    replay.insert(replay.begin(), taken.begin(), taken.end());
  }

  static bool takes_text_block(const StructuredRecord& r) {
    return r.schema && r.schema->form_type == "F99" && r.schema->index_of("text");
  }

  bool finish_text_block() {
    in_text = false;
    if (text_orphan || !pending) {
      issue(text_index, ParseOutcome::skipped("text block without F99 record",
                                              "block starting at record " + std::to_string(text_index)));
      return true;
    }
    pending->set("text", text_buf);
    text_buf.clear();
    return flush_pending();
  }

  bool process(RawRecord& r, bool is_header = false) {
    std::string_view view = r.view();

    if (in_text) {
      if (is_text_block_end(view)) return finish_text_block();
      if (text_has_line) text_buf.push_back('\n');
      text_has_line = true;
      text_buf += builder->text(view);
      return true;
    }
    if (is_text_block_begin(view)) {
      in_text = true;
      text_orphan = !pending;
      text_has_line = false;
      text_index = r.index();
      text_buf.clear();
      return true;
    }
    if (is_blank(view)) return true;
    if (ends_in_open_quote(view, delim, cfg.quote)) join_quoted_lines(r);

    if (!flush_pending()) return false;

    Tokenizer tok(r, delim, cfg.quote);
    Classification cls;
    if (!classifier->classify(tok, cls)) {
      issue(r.index(), ParseOutcome::fatal(classifier->reason(), classifier->detail()));
      return true;
    }

    ParseOutcome o = builder->build(tok, cls, r.index());
    if (!o.ok()) {
      issue(r.index(), o);
      return true;
    }
    if (is_header && !cfg.emit_header) {
      ++sum.total_records;
      ++sum.succeeded;
      return true;
    }
    if (takes_text_block(o.record)) {
      pending = std::move(o.record);
      return true;
    }
    return deliver(o.record);
  }

  // Legacy "/* Header" blocks carry key = value lines; map them onto the
  // HDR layout so the header stream looks like a modern one.
  bool process_legacy_header(const FilingHeader& hdr, std::uint64_t index) {
    const Schema* schema = registry.resolve(version, "HDR");
    if (!schema || !cfg.emit_header) {
      ++sum.total_records;
      ++sum.succeeded;
      return true;
    }
    StructuredRecord r;
    r.form_type = "HDR";
    r.schema = schema;
    r.index = index;
    for (const auto& col : schema->columns) {
      std::string v;
      if (col.name == "record_type")        v = "HDR";
      else if (col.name == "ef_type")       v = "FEC";
      else if (col.name == "fec_version")   v = hdr.version_text.empty() ? version.str() : hdr.version_text;
      else if (col.name == "soft_name")     v = legacy_header_value(hdr, "Soft_Name");
      else if (col.name == "soft_ver")      v = legacy_header_value(hdr, "Soft_Ver#");
      else if (col.name == "name_delim")    v = legacy_header_value(hdr, "Name_Delim");
      else if (col.name == "report_id")     v = legacy_header_value(hdr, "Report_ID");
      else if (col.name == "report_number") v = legacy_header_value(hdr, "Report_Number");
      else if (col.name == "comment")       v = legacy_header_value(hdr, "Comment");
      else                                  v = legacy_header_value(hdr, col.name);
      r.values.push_back(builder->text(v));
    }
    return deliver(r);
  }

  bool read_legacy_header(FilingHeader& hdr) {
    while (true) {
      switch (reader.next(rec)) {
        case RecordReader::Status::Record:
          if (is_legacy_header_end(rec.view())) return true;
          add_legacy_header_line(rec.view(), hdr);
          break;
        case RecordReader::Status::Oversize:
          return fail_file("legacy header line " + std::to_string(rec.index()) + " exceeds size limit");
        case RecordReader::Status::End:
          return fail_file("unterminated legacy header");
        case RecordReader::Status::Error:
          return fail_file(reader.error());
      }
    }
  }

  void end_of_input() {
    if (in_text) {
      note("text block starting at record " + std::to_string(text_index) + " has no end marker");
      (void)finish_text_block();
    }
    (void)flush_pending();
  }

  bool finish() {
    if (emitters) {
      if (!emitters->flush_all()) fail_file(emitters->error());
      sum.rows_by_form_type = emitters->rows_by_form();
    }
    if (builder) sum.degraded_fields = builder->degraded_fields();
    sum.bytes_read = reader.bytes_read();
    if (err.empty()) set_state(CoordinatorState::Done);
    return err.empty();
  }

  bool run() {
    if (ran) return err.empty();
    ran = true;
    set_state(CoordinatorState::Start);

    // --- header
    RecordReader::Status st;
    do { st = reader.next(rec); } while (st == RecordReader::Status::Record && is_blank(rec.view()));
    if (st == RecordReader::Status::Error) { fail_file(reader.error()); return finish(); }
    if (st == RecordReader::Status::End)   { fail_file("empty input: no header record"); return finish(); }
    if (st == RecordReader::Status::Oversize) { fail_file("header record exceeds size limit"); return finish(); }

    if (strip_bom(rec.view()).size() != rec.size()) {
      std::string copy(strip_bom(rec.view()));
      rec.assign(copy, rec.index(), rec.offset() + 3);
    }

    FilingHeader hdr;
    const std::uint64_t header_index = rec.index();
    bool header_is_data = false;
    if (is_legacy_header_start(rec.view())) {
      hdr.legacy = true;
      hdr.delimiter = cfg.delimiter_override ? *cfg.delimiter_override : kCommaDelimiter;
      if (!read_legacy_header(hdr)) return finish();
      if (!hdr.version && !cfg.version_override) {
        fail_file("legacy header missing FEC_Ver_#");
        return finish();
      }
    } else {
      std::string herr;
      if (!parse_modern_header(rec.view(), cfg.delimiter_override, cfg.quote, hdr, herr)) {
        const bool not_hdr = herr == "header record is not HDR";
        if (!cfg.version_override) { fail_file(herr); return finish(); }
        // with a forced version, a headerless file starts with data
        header_is_data = not_hdr;
      }
    }

    version = cfg.version_override ? *cfg.version_override : *hdr.version;
    if (!registry.covers(version)) {
      fail_file("unknown filing version " + version.str() + ": no schemas at or before it");
      return finish();
    }
    delim = hdr.delimiter;
    enc = cfg.encoding_override ? *cfg.encoding_override : default_encoding_for(version);

    sum.version = version.str();
    sum.delimiter = delimiter_name(delim);
    sum.encoding = encoding_mode_name(enc);
    sum.legacy_header = hdr.legacy;
    set_state(CoordinatorState::VersionDetected);
    note("version " + sum.version + ", delimiter " + sum.delimiter + ", encoding " + sum.encoding +
         (hdr.software.empty() ? std::string() : ", software " + hdr.software));

    classifier = std::make_unique<RecordClassifier>(registry, version);
    builder = std::make_unique<RowBuilder>(cfg.policy, enc);
    emitters = std::make_unique<EmitterSet>(sinks, cfg.emitter, cfg.filing_id, cfg.include_filing_id);

    set_state(CoordinatorState::Streaming);
    bool ok;
    if (hdr.legacy)          ok = process_legacy_header(hdr, header_index);
    else if (header_is_data) ok = process(rec);
    else                     ok = process(rec, true);
    if (!ok) return finish();

    // --- records
    while (true) {
      if (stop.load()) {
        sum.cancelled = true;
        note("stopped after record " + std::to_string(reader.records()));
        // a record still collecting its text block is incomplete
        if (in_text) { pending.reset(); in_text = false; }
        (void)flush_pending();
        return finish();
      }
      st = pull(rec);
      if (st == RecordReader::Status::Record) {
        if (!process(rec)) return finish();
      } else if (st == RecordReader::Status::Oversize) {
        if (in_text) note("text line at record " + std::to_string(rec.index()) + " exceeds size limit, dropped");
        else issue(rec.index(), ParseOutcome::skipped("record exceeds size limit",
                                                      "limit " + std::to_string(cfg.reader.max_record_bytes) + " bytes"));
      } else if (st == RecordReader::Status::End) {
        end_of_input();
        return finish();
      } else {
        fail_file(reader.error());
        end_of_input();
        return finish();
      }
    }
  }
};

StreamCoordinator::StreamCoordinator(const SchemaRegistry& registry, ByteSource& source, SinkFactory sinks)
  : StreamCoordinator(registry, source, std::move(sinks), Config{}) {}

StreamCoordinator::StreamCoordinator(const SchemaRegistry& registry, ByteSource& source, SinkFactory sinks,
                                     Config cfg)
  : p_(new Impl(registry, source, std::move(sinks), std::move(cfg))) {}

StreamCoordinator::~StreamCoordinator() { delete p_; }

void StreamCoordinator::set_warn_callback(WarnCallback cb) { p_->warn = std::move(cb); }
bool StreamCoordinator::run() { return p_->run(); }
void StreamCoordinator::request_stop() noexcept { p_->stop.store(true); }
CoordinatorState StreamCoordinator::state() const noexcept { return p_->state.load(); }
const FileSummary& StreamCoordinator::summary() const noexcept { return p_->sum; }
const std::string& StreamCoordinator::error() const noexcept { return p_->err; }

}
