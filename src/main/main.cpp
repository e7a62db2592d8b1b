#include "fec_scanner/batch.hpp"
#include "fec_scanner/config_loader.hpp"
#include "fec_scanner/header.hpp"
#include "fec_scanner/path_utils.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/summary.hpp"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 2;
constexpr int kExitFatalFile = 3;

void usage(std::ostream& o) {
  o <<
    "Usage: fec-scanner [--config=FILE] [--output-dir=DIR] [--jobs=N]\n"
    "                   [--encoding=utf8|windows-1252|sniff] [--delimiter=comma|fs]\n"
    "                   [--version=X.Y] [--schemas=FILE] [--include-filing-id]\n"
    "                   [--no-header-row] [--silent] [--warn] FILE...\n";
}

// Returns kExitOk, kExitUsage, or -1 for --help.
int parse_cli(int argc, char** argv, fec::AppConfig& c, std::string& err) {
  // a config file is applied first so flags can override it
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) {
      if (!fec::load_app_config(a.substr(9), c, &err)) return kExitUsage;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    std::string v;
    auto eat = [&](const char* pfx){
      if (a.rfind(pfx, 0) == 0) { v = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--config=")) continue;
    if (eat("--output-dir=")) { c.output_dir = v; continue; }
    if (eat("--jobs=")) {
      std::size_t n = 0;
      auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      if (ec != std::errc() || p != v.data() + v.size()) { err = "bad --jobs value: " + v; return kExitUsage; }
      c.jobs = n;
      continue;
    }
    if (eat("--encoding=")) {
      auto m = fec::parse_encoding_mode(v);
      if (!m) { err = "unknown encoding: " + v; return kExitUsage; }
      c.scan.encoding_override = *m;
      continue;
    }
    if (eat("--delimiter=")) {
      auto d = fec::parse_delimiter(v);
      if (!d) { err = "unknown delimiter: " + v; return kExitUsage; }
      c.scan.delimiter_override = *d;
      continue;
    }
    if (eat("--version=")) {
      auto ver = fec::FilingVersion::parse(v);
      if (!ver) { err = "bad version: " + v; return kExitUsage; }
      c.scan.version_override = *ver;
      continue;
    }
    if (eat("--schemas=")) { c.schema_files.push_back(v); continue; }
    if (a == "--include-filing-id") { c.scan.include_filing_id = true; continue; }
    if (a == "--no-header-row")     { c.scan.emit_header = false; continue; }
    if (a == "--silent")            { c.silent = true; continue; }
    if (a == "--warn")              { c.warn = true; continue; }
    if (a == "-h" || a == "--help") return -1;
    if (a.size() > 1 && a[0] == '-') { err = "unknown option: " + a; return kExitUsage; }
    c.inputs.push_back(a);
  }
  if (c.inputs.empty()) { err = "no input files"; return kExitUsage; }
  return kExitOk;
}

// Unique output folder name per input; repeated stems get a numeric suffix.
std::vector<std::string> filing_ids_for(const std::vector<std::string>& inputs) {
  std::vector<std::string> ids;
  std::map<std::string, int> seen;
  for (const auto& in : inputs) {
    std::string id = fec::filing_id_from_path(in);
    int n = ++seen[id];
    if (n > 1) id += "-" + std::to_string(n);
    ids.push_back(id);
  }
  return ids;
}

}

int main(int argc, char** argv) {
  fec::AppConfig app;
  std::string err;
  int rc = parse_cli(argc, argv, app, err);
  if (rc == -1) { usage(std::cout); return kExitOk; }
  if (rc != kExitOk) {
    std::cerr << "[scan] " << err << "\n";
    usage(std::cerr);
    return rc;
  }

  // --- schemas
  fec::SchemaRegistry registry;
  fec::register_builtin_schemas(registry);
  for (const auto& f : app.schema_files) {
    if (!fec::load_schemas_file(f, registry, &err)) {
      std::cerr << "[scan] schema load failed: " << err << "\n";
      return kExitUsage;
    }
  }
  registry.freeze();

  // --- jobs
  const auto ids = filing_ids_for(app.inputs);
  std::vector<fec::BatchJob> jobs;
  jobs.reserve(app.inputs.size());
  for (std::size_t i = 0; i < app.inputs.size(); ++i) {
    fec::BatchJob job;
    job.path = app.inputs[i];
    job.config = app.scan;
    job.config.filing_id = ids[i];
    job.config.warn_records = app.warn;
    job.sinks = fec::make_directory_sink_factory(
        (std::filesystem::path(app.output_dir) / ids[i]).string());
    jobs.push_back(std::move(job));
  }

  std::mutex log_mu;
  fec::WarnCallback warn;
  if (!app.silent) {
    warn = [&log_mu](std::string_view msg) {
      std::lock_guard<std::mutex> lock(log_mu);
      std::cerr << "[warn] " << msg << "\n";
    };
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  auto results = fec::run_batch(registry, std::move(jobs), app.jobs, warn);
  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  // --- summaries
  int exit_code = kExitOk;
  std::uint64_t bytes = 0;
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto& r = results[i];
    bytes += r.summary.bytes_read;
    const auto out = std::filesystem::path(app.output_dir) / ids[i] / "summary.json";
    if (!fec::write_text_file(out, fec::SummaryJsonWriter::to_json(r.summary), &err)) {
      std::cerr << "[scan] " << err << "\n";
      exit_code = kExitFatalFile;
    }
    if (!r.ok) {
      exit_code = kExitFatalFile;
      std::cerr << "[scan] failed: " << r.path << ": " << r.error << "\n";
      continue;
    }
    if (!app.silent) {
      std::cerr << "[scan] ok: " << r.path
                << " records=" << r.summary.total_records
                << " succeeded=" << r.summary.succeeded
                << " skipped=" << r.summary.skipped
                << " fatal=" << r.summary.fatal
                << (r.summary.cancelled ? " (cancelled)" : "")
                << " -> " << (std::filesystem::path(app.output_dir) / ids[i]).string() << "\n";
    }
  }

  if (!app.silent) {
    const double mb = bytes / (1024.0 * 1024.0);
    const double sec = wall_ms / 1000.0;
    std::cerr << "[scan] " << results.size() << " file(s), " << mb << " MiB in " << wall_ms << " ms";
    if (sec > 0.0) std::cerr << " (" << (mb / sec) << " MiB/s)";
    std::cerr << "\n";
  }
  return exit_code;
}
