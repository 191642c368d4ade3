#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/metadata/CatalogStore.hpp"
#include "core/scan/Progress.hpp"
#include "core/scan/ScanJob.hpp"

namespace zipcat {

enum class ScanState { Idle, Partitioning, Running, Merging, Done, Aborted };
const char* to_string(ScanState s);

struct ScanOptions {
  size_t max_concurrency = 4;          // 1 = volumes one after another
  std::filesystem::path temp_dir;      // isolated stores; empty = next to the catalog
  int probe_retries = 2;
  std::chrono::milliseconds heartbeat_interval{2000};
};

struct VolumeResult {
  std::string volume;
  std::string root;
  int64_t     archives = 0;
  int64_t     entries = 0;
  JobStatus   status = JobStatus::Pending;
  std::optional<std::string> error;
  std::vector<PathFailure>   failures;
  double      duration_seconds = 0.0;
  std::optional<MergeSummary> merge;
};

struct ScanSummary {
  ScanState state = ScanState::Idle;
  int64_t   total_archives = 0;
  int64_t   total_entries = 0;
  std::vector<VolumeResult> per_volume;   // same order as the input volumes
  double    duration_seconds = 0.0;

  std::vector<std::string> failedVolumes() const;
};

nlohmann::json toJson(const ScanSummary& s);

// Scans volumes in parallel, one private store per volume, then folds the
// private stores into the final catalog one at a time in volume-label order.
//
// Idle -> Partitioning -> Running -> Merging -> Done, or Aborted when no job
// succeeds or cancel() was called. A failing volume never stops its siblings.
class ScanCoordinator {
public:
  ScanCoordinator(CatalogStore& catalog, ScanOptions options, ProgressReporter& progress,
                  JobRunner runner = runScanJob);

  ScanSummary run(const std::vector<VolumeSpec>& volumes);

  // Safe from any thread, including a signal-driven watcher. Applies to the
  // run in progress, or to the next one when called while idle; it is
  // cleared when that run returns.
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }
  ScanState state() const { return state_.load(); }

private:
  std::vector<ScanJob> partition(const std::vector<VolumeSpec>& volumes);
  void runJobs(std::vector<ScanJob>& jobs);
  void runOne(ScanJob& job);
  void mergeJobs(std::vector<ScanJob>& jobs, std::vector<VolumeResult>& results);

  CatalogStore&     catalog_;
  ScanOptions       options_;
  ProgressReporter& progress_;
  JobRunner         runner_;
  std::atomic<ScanState> state_{ScanState::Idle};
  std::atomic<bool>      cancelled_{false};
};

} // namespace zipcat
