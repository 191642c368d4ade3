#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/archive/ArchiveProber.hpp"
#include "core/metadata/CatalogStore.hpp"
#include "core/scan/Progress.hpp"
#include "core/scan/VolumeWalker.hpp"

namespace zipcat {

struct VolumeSpec {
  std::string           label;
  std::filesystem::path root;
  InclusionPolicy       policy;
};

enum class JobStatus { Pending, Running, Succeeded, Failed };
const char* to_string(JobStatus s);

// One path that could not be indexed, with enough context to retry it.
struct PathFailure {
  std::string path;
  std::string code;    // ErrorCode name, or "Skipped" for walker skips
  std::string reason;
};

// Per-volume unit of work. The job owns its private store until the merge.
struct ScanJob {
  size_t      index = 0;
  VolumeSpec  volume;
  std::unique_ptr<CatalogStore> store;

  JobStatus   status = JobStatus::Pending;
  std::string error;
  bool        interrupted = false;   // stopped early on cancellation

  int64_t archives_seen = 0;         // candidates probed
  int64_t archives = 0;              // archives recorded in the private store
  int64_t entries = 0;
  std::vector<PathFailure> failures;
  double duration_seconds = 0.0;
};

using ArchiveProbe =
  std::function<ProbeResult(const std::string& path, const std::string& volume, const ProbeOptions&)>;

struct JobContext {
  const std::atomic<bool>&  cancelled;
  ProgressReporter&         progress;
  int                       probe_retries = 2;
  std::chrono::milliseconds heartbeat_interval{2000};
  ArchiveProbe              probe = probeArchive;
};

// Calls `probe`, repeating it up to `retries` more times while it fails with
// a retryable CatalogError. Other errors, and the last retryable one,
// propagate.
ProbeResult probeWithRetry(const ArchiveProbe& probe, const std::string& path,
                           const std::string& volume, const ProbeOptions& opts, int retries);

// How one job is executed. Throwing marks the job Failed.
using JobRunner = std::function<void(ScanJob&, const JobContext&)>;

// Volume Walker -> Archive Prober -> private store. Cancellation is observed
// between archives only.
void runScanJob(ScanJob& job, const JobContext& ctx);

} // namespace zipcat
