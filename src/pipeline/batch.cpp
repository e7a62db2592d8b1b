#include "fec_scanner/batch.hpp"
#include "fec_scanner/byte_source.hpp"
#include "fec_scanner/schema_registry.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace fec {

static BatchResult run_job(const SchemaRegistry& registry, BatchJob& job, const WarnCallback& warn) {
  BatchResult res;
  res.path = job.path;
  FileByteSource src(job.path);
  StreamCoordinator coord(registry, src, std::move(job.sinks), std::move(job.config));
  if (warn) {
    const std::string tag = "[" + job.path + "] ";
    coord.set_warn_callback([&warn, tag](std::string_view msg) {
      warn(tag + std::string(msg));
    });
  }
  res.ok = coord.run();
  res.summary = coord.summary();
  res.error = coord.error();
  return res;
}

std::vector<BatchResult> run_batch(const SchemaRegistry& registry, std::vector<BatchJob> jobs,
                                   std::size_t threads, const WarnCallback& warn) {
  if (!registry.frozen()) throw std::logic_error("run_batch: schema registry must be frozen");

  std::vector<BatchResult> results(jobs.size());
  if (jobs.empty()) return results;

  std::size_t worker_threads = threads;
  if (worker_threads == 0)
    worker_threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  worker_threads = std::min(worker_threads, jobs.size());

  std::atomic<std::size_t> next_idx{0};
  auto worker = [&]() {
    while (true) {
      const std::size_t i = next_idx.fetch_add(1);
      if (i >= jobs.size()) break;
      results[i] = run_job(registry, jobs[i], warn);
    }
  };

  if (worker_threads == 1) {
    worker();
    return results;
  }

  std::vector<std::thread> pool;
  pool.reserve(worker_threads);
  for (std::size_t t = 0; t < worker_threads; ++t) pool.emplace_back(worker);
  for (auto& t : pool) t.join();
  return results;
}

}
