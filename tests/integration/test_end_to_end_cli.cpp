#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static int run_scanner(const std::string& bin, const std::string& args, const fs::path& log) {
  std::string cmd = "\"" + bin + "\" " + args + " >\"" + log.string() + "\" 2>&1";
  return std::system(cmd.c_str());
}

int main() {
  const std::string bin = env_or("FEC_SCANNER_BIN", "build/fec-scanner");
  const fs::path data("tests/data");
  const fs::path good = data / "v8_3_fs_mixed.fec";
  const fs::path legacy = data / "v5_00_comma.fec";
  const fs::path bad = data / "bad_missing_version.fec";
  if (!fs::exists(good) || !fs::exists(legacy) || !fs::exists(bad)) {
    std::cerr << "[ERR] fixtures not found under " << data << "\n";
    return 2;
  }

  const fs::path root = fs::path(env_or("FEC_TEST_OUT", "it-output")) /
                        ("cli-" + std::to_string(std::time(nullptr)));
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  const fs::path log = root / "scanner.log";

  bool ok = true;

  // good files: exit 0, one folder per filing
  int rc = run_scanner(bin, "--output-dir=\"" + (root / "good").string() + "\" --jobs=2 --include-filing-id \"" +
                            good.string() + "\" \"" + legacy.string() + "\"", log);
  if (rc != 0) {
    std::cerr << "[FAIL] scanner returned " << rc << " for good input (see " << log << ")\n";
    return 1;
  }

  const fs::path out = root / "good" / "v8_3_fs_mixed";
  for (const char* f : {"summary.json", "HDR.csv", "F3XN.csv", "SA11AI.csv", "SA17.csv", "SB23.csv", "TEXT.csv"}) {
    if (!fs::exists(out / f)) { std::cerr << "[FAIL] missing output " << (out / f) << "\n"; ok = false; }
  }
  if (fs::exists(out / "SX99.csv")) { std::cerr << "[FAIL] stream written for an unknown form type\n"; ok = false; }
  if (!fs::exists(root / "good" / "v5_00_comma" / "summary.json")) {
    std::cerr << "[FAIL] no summary for the comma filing\n";
    ok = false;
  }

  try {
    simdjson::ondemand::parser p;
    simdjson::padded_string json = simdjson::padded_string::load((out / "summary.json").string());
    auto doc = p.iterate(json);
    std::uint64_t total = doc["total_records"].get_uint64();
    std::uint64_t succeeded = doc["succeeded"].get_uint64();
    std::uint64_t skipped = doc["skipped"].get_uint64();
    std::uint64_t fatal = doc["fatal"].get_uint64();
    std::string_view version = doc["version"].get_string();
    std::string_view delim = doc["delimiter"].get_string();
    if (total != 11 || succeeded != 8 || skipped != 2 || fatal != 1) {
      std::cerr << "[FAIL] counts total=" << total << " succeeded=" << succeeded
                << " skipped=" << skipped << " fatal=" << fatal << "\n";
      ok = false;
    }
    if (version != "8.3" || delim != "fs") {
      std::cerr << "[FAIL] version/delimiter: " << version << " / " << delim << "\n";
      ok = false;
    }
  } catch (const simdjson::simdjson_error& e) {
    std::cerr << "[FAIL] summary.json: " << e.what() << "\n";
    ok = false;
  }

  // a failing file makes the run fail but still gets a summary
  rc = run_scanner(bin, "--silent --output-dir=\"" + (root / "mixed").string() + "\" \"" + good.string() + "\" \"" +
                        bad.string() + "\"", log);
  if (rc == 0) { std::cerr << "[FAIL] scanner succeeded with a bad filing\n"; ok = false; }
  try {
    simdjson::ondemand::parser p;
    simdjson::padded_string json =
        simdjson::padded_string::load((root / "mixed" / "bad_missing_version" / "summary.json").string());
    auto doc = p.iterate(json);
    bool file_ok = doc["ok"].get_bool();
    std::string_view err = doc["error"].get_string();
    if (file_ok || err.find("version") == std::string_view::npos) {
      std::cerr << "[FAIL] bad filing summary: ok=" << file_ok << " error=" << err << "\n";
      ok = false;
    }
  } catch (const simdjson::simdjson_error& e) {
    std::cerr << "[FAIL] bad filing summary.json: " << e.what() << "\n";
    ok = false;
  }
  if (!fs::exists(root / "mixed" / "v8_3_fs_mixed" / "SA11AI.csv")) {
    std::cerr << "[FAIL] good filing not processed next to a bad one\n";
    ok = false;
  }

  // usage errors
  rc = run_scanner(bin, "--encoding=ebcdic \"" + good.string() + "\"", log);
  if (rc == 0) { std::cerr << "[FAIL] bad --encoding accepted\n"; ok = false; }

  if (!ok) return 1;
  std::cout << "[PASS] end-to-end CLI: out=" << root << "\n";
  return 0;
}
