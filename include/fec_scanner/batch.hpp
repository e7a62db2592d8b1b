#pragma once
#include "fec_scanner/coordinator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fec {

struct BatchJob {
  std::string path;
  StreamCoordinator::Config config;
  SinkFactory sinks;
};

struct BatchResult {
  std::string path;
  bool ok = false;
  FileSummary summary;
  std::string error;
};

// Runs one StreamCoordinator per job on `threads` workers (0 = hardware
// concurrency). Results come back in job order. The registry must be frozen;
// `warn` is called from worker threads and must be thread-safe.
// Throws std::logic_error for an unfrozen registry.
std::vector<BatchResult> run_batch(const SchemaRegistry& registry, std::vector<BatchJob> jobs,
                                   std::size_t threads, const WarnCallback& warn = {});

}
