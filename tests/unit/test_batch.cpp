#include "fec_scanner/batch.hpp"
#include "fec_scanner/path_utils.hpp"
#include "fec_scanner/schema_registry.hpp"
#include "fec_scanner/tokenizer.hpp"
#include "test_support.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  fec_test::Checker t;
  const std::string FS(1, fec::kFileSeparator);

  fec::SchemaRegistry registry;
  fec::register_builtin_schemas(registry);

  {
    bool threw = false;
    try { fec::run_batch(registry, {}, 1); } catch (const std::logic_error&) { threw = true; }
    t.expect(threw, "unfrozen registry rejected");
  }
  registry.freeze();

  const fs::path dir = fs::temp_directory_path() / "fec_scanner_test_batch";
  std::error_code ec;
  fs::remove_all(dir, ec);

  // eight small filings; file i carries i contributions
  std::vector<std::string> paths;
  for (int i = 0; i < 8; ++i) {
    std::string body = "HDR" + FS + "FEC" + FS + "8.3\n";
    for (int k = 0; k < i; ++k) body += "SA11AI" + FS + "C001" + FS + "T" + std::to_string(k) + "\n";
    const fs::path p = dir / ("filing" + std::to_string(i) + ".fec");
    std::string err;
    t.expect(fec::write_text_file(p, body, &err), "write fixture " + p.string());
    paths.push_back(p.string());
  }
  paths.push_back((dir / "missing.fec").string());

  std::vector<std::unique_ptr<fec::MemoryStreams>> streams;
  std::vector<fec::BatchJob> jobs;
  for (const auto& p : paths) {
    streams.push_back(std::make_unique<fec::MemoryStreams>());
    fec::BatchJob job;
    job.path = p;
    job.config.filing_id = fec::filing_id_from_path(p);
    job.sinks = streams.back()->factory();
    jobs.push_back(std::move(job));
  }

  std::atomic<int> warnings{0};
  fec::WarnCallback warn = [&warnings](std::string_view m) {
    if (m.size() > 1 && m[0] == '[') ++warnings;
  };

  auto results = fec::run_batch(registry, std::move(jobs), 4, warn);
  t.expect_num(results.size(), paths.size(), "one result per job");
  bool ordered = true, counts = true;
  for (int i = 0; i < 8 && i < static_cast<int>(results.size()); ++i) {
    const auto& r = results[i];
    if (r.path != paths[i]) ordered = false;
    if (!r.ok || r.summary.succeeded != static_cast<std::uint64_t>(i + 1)) counts = false;
    if (i > 0 && streams[i]->get("SA11AI").find("T" + std::to_string(i - 1)) == std::string::npos) counts = false;
  }
  t.expect(ordered, "results in job order");
  t.expect(counts, "each filing processed independently");
  t.expect(results.size() == 9 && results[3].summary.filing_id == "filing3", "filing id per job");

  const auto& missing = results.back();
  t.expect(!missing.ok, "missing file fails");
  t.expect(missing.error.find("open failed") != std::string::npos, "missing file error");
  t.expect(missing.summary.total_records == 0, "missing file has an empty summary");
  t.expect(warnings.load() >= 9, "warnings tagged with the file path");

  // a single worker gives the same answers
  std::vector<fec::BatchJob> again;
  std::vector<std::unique_ptr<fec::MemoryStreams>> streams2;
  for (const auto& p : paths) {
    streams2.push_back(std::make_unique<fec::MemoryStreams>());
    fec::BatchJob job;
    job.path = p;
    job.sinks = streams2.back()->factory();
    again.push_back(std::move(job));
  }
  auto serial = fec::run_batch(registry, std::move(again), 1);
  bool same = serial.size() == results.size();
  for (std::size_t i = 0; same && i < serial.size(); ++i) {
    same = serial[i].ok == results[i].ok && serial[i].summary.total_records == results[i].summary.total_records &&
           streams2[i]->all() == streams[i]->all();
  }
  t.expect(same, "one worker and four workers agree");

  t.expect(fec::run_batch(registry, {}, 0).empty(), "no jobs, no results");

  fs::remove_all(dir, ec);
  return t.finish("batch");
}
