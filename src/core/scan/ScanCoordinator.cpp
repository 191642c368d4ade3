#include "ScanCoordinator.hpp"

#include <algorithm>
#include <numeric>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/util/WorkerPool.hpp"

namespace zipcat {

using nlohmann::json;

const char* to_string(ScanState s) {
  switch (s) {
    case ScanState::Idle:         return "idle";
    case ScanState::Partitioning: return "partitioning";
    case ScanState::Running:      return "running";
    case ScanState::Merging:      return "merging";
    case ScanState::Done:         return "done";
    case ScanState::Aborted:      return "aborted";
  }
  return "unknown";
}

std::vector<std::string> ScanSummary::failedVolumes() const {
  std::vector<std::string> out;
  for (const auto& v : per_volume)
    if (v.status == JobStatus::Failed) out.push_back(v.volume);
  return out;
}

json toJson(const ScanSummary& s) {
  json vols = json::array();
  for (const auto& v : s.per_volume) {
    json j = {
      {"volume", v.volume},
      {"root", v.root},
      {"archives", v.archives},
      {"entries", v.entries},
      {"status", to_string(v.status)},
      {"duration", v.duration_seconds}
    };
    if (v.error) j["error"] = *v.error;
    if (!v.failures.empty()) {
      json f = json::array();
      for (const auto& pf : v.failures) f.push_back({{"path", pf.path}, {"code", pf.code}, {"reason", pf.reason}});
      j["failures"] = f;
    }
    if (v.merge) {
      j["merge"] = {
        {"archives_merged", v.merge->archives_merged},
        {"entries_merged", v.merge->entries_merged},
        {"archives_skipped", v.merge->archives_skipped},
        {"entries_skipped", v.merge->entries_skipped},
        {"elapsed", v.merge->elapsed_seconds}
      };
    }
    vols.push_back(std::move(j));
  }
  return {
    {"state", to_string(s.state)},
    {"total_archives", s.total_archives},
    {"total_entries", s.total_entries},
    {"per_volume", vols},
    {"failed_volumes", s.failedVolumes()},
    {"duration", s.duration_seconds}
  };
}

ScanCoordinator::ScanCoordinator(CatalogStore& catalog, ScanOptions options,
                                 ProgressReporter& progress, JobRunner runner)
  : catalog_(catalog), options_(std::move(options)), progress_(progress), runner_(std::move(runner)) {
  if (options_.max_concurrency == 0) options_.max_concurrency = 1;
  if (options_.temp_dir.empty()) {
    options_.temp_dir = std::filesystem::path(catalog_.path()).parent_path();
    if (options_.temp_dir.empty()) options_.temp_dir = ".";
  }
}

// -------- phases --------

static void disposeStore(ScanJob& job) {
  if (!job.store) return;
  try {
    job.store->dispose();
  } catch (const std::exception& e) {
    spdlog::warn("[{}] could not dispose private store: {}", job.volume.label, e.what());
  }
}

std::vector<ScanJob> ScanCoordinator::partition(const std::vector<VolumeSpec>& volumes) {
  std::vector<ScanJob> jobs(volumes.size());
  for (size_t i = 0; i < volumes.size(); ++i) {
    auto& job = jobs[i];
    job.index = i;
    job.volume = volumes[i];
    try {
      job.store = CatalogStore::createIsolated(options_.temp_dir,
                                               "zipcat-job" + std::to_string(i) + "_" + volumes[i].label);
    } catch (const std::exception& e) {
      job.status = JobStatus::Failed;
      job.error = std::string("cannot create private store: ") + e.what();
      spdlog::error("[{}] {}", job.volume.label, job.error);
    }
  }
  return jobs;
}

void ScanCoordinator::runOne(ScanJob& job) {
  if (job.status == JobStatus::Failed) return;
  if (cancelled_.load()) {
    job.status = JobStatus::Failed;
    job.error = "cancelled before start";
    return;
  }

  job.status = JobStatus::Running;
  const auto t0 = std::chrono::steady_clock::now();
  spdlog::info("[{}] scanning {} ({})", job.volume.label, job.volume.root.string(),
               job.volume.policy.mode == ScanMode::MarkerFolders ? "marker folders" : "full volume");

  JobContext ctx{cancelled_, progress_, options_.probe_retries, options_.heartbeat_interval};
  try {
    runner_(job, ctx);
    if (job.interrupted) {
      job.status = JobStatus::Failed;
      job.error = "cancelled";
    } else {
      job.status = JobStatus::Succeeded;
    }
  } catch (const std::exception& e) {
    job.status = JobStatus::Failed;
    job.error = e.what();
  }
  job.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  if (job.status == JobStatus::Failed) {
    spdlog::error("[{}] FAILED: {}", job.volume.label, job.error);
    return;
  }
  ProgressEvent ev;
  ev.kind = ProgressKind::JobFinished;
  ev.job_id = job.volume.label;
  ev.archives = job.archives;
  ev.entries = job.entries;
  ev.elapsed_seconds = job.duration_seconds;
  progress_.report(ev);
}

void ScanCoordinator::runJobs(std::vector<ScanJob>& jobs) {
  // Workers pull job indices from a shared cursor; each touches only its own slot.
  std::atomic<size_t> cursor{0};
  auto worker = [&] {
    for (;;) {
      const size_t i = cursor.fetch_add(1);
      if (i >= jobs.size()) return;
      runOne(jobs[i]);
    }
  };

  runWorkers(std::min(options_.max_concurrency, jobs.size()), worker);
}

void ScanCoordinator::mergeJobs(std::vector<ScanJob>& jobs, std::vector<VolumeResult>& results) {
  std::vector<size_t> order(jobs.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (jobs[a].volume.label != jobs[b].volume.label) return jobs[a].volume.label < jobs[b].volume.label;
    return a < b;
  });

  for (size_t i : order) {
    auto& job = jobs[i];
    auto& res = results[i];
    if (job.status != JobStatus::Succeeded) continue;

    if (cancelled_.load()) {
      res.status = JobStatus::Failed;
      res.error = "merge skipped: scan cancelled";
      continue;
    }
    try {
      auto m = catalog_.mergeFrom(*job.store);
      res.merge = m;
      ProgressEvent ev;
      ev.kind = ProgressKind::Merged;
      ev.job_id = job.volume.label;
      ev.archives = m.archives_merged;
      ev.entries = m.entries_merged;
      ev.elapsed_seconds = m.elapsed_seconds;
      progress_.report(ev);
    } catch (const std::exception& e) {
      // Already committed sources are untouched; this one rolled back.
      res.status = JobStatus::Failed;
      res.error = std::string("merge failed: ") + e.what();
      spdlog::error("[MERGE] {}: {}", job.volume.label, e.what());
    }
    disposeStore(job);
  }
}

ScanSummary ScanCoordinator::run(const std::vector<VolumeSpec>& volumes) {
  const auto t0 = std::chrono::steady_clock::now();
  ScanSummary summary;

  state_ = ScanState::Partitioning;
  auto jobs = partition(volumes);

  state_ = ScanState::Running;
  runJobs(jobs);

  summary.per_volume.resize(jobs.size());
  for (size_t i = 0; i < jobs.size(); ++i) {
    const auto& job = jobs[i];
    auto& r = summary.per_volume[i];
    r.volume = job.volume.label;
    r.root = job.volume.root.string();
    r.archives = job.archives;
    r.entries = job.entries;
    r.status = job.status;
    if (!job.error.empty()) r.error = job.error;
    r.failures = job.failures;
    r.duration_seconds = job.duration_seconds;
  }

  state_ = ScanState::Merging;
  mergeJobs(jobs, summary.per_volume);

  // Every private store goes away, merged or not.
  for (auto& job : jobs) disposeStore(job);

  size_t succeeded = 0;
  for (const auto& r : summary.per_volume) {
    if (r.status != JobStatus::Succeeded) continue;
    ++succeeded;
    summary.total_archives += r.archives;
    summary.total_entries += r.entries;
  }

  const bool aborted = cancelled_.load() || (!jobs.empty() && succeeded == 0);
  summary.state = aborted ? ScanState::Aborted : ScanState::Done;
  summary.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  state_ = summary.state;
  // A cancel applies to one run; the coordinator can be run again.
  cancelled_.store(false);

  spdlog::info("scan {}: {} archives, {} entries from {}/{} volumes ({:.1f}s)",
               to_string(summary.state), summary.total_archives, summary.total_entries,
               succeeded, jobs.size(), summary.duration_seconds);
  return summary;
}

} // namespace zipcat
