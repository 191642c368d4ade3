#include "ScanJob.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace zipcat {

const char* to_string(JobStatus s) {
  switch (s) {
    case JobStatus::Pending:   return "pending";
    case JobStatus::Running:   return "running";
    case JobStatus::Succeeded: return "succeeded";
    case JobStatus::Failed:    return "failed";
  }
  return "unknown";
}

ProbeResult probeWithRetry(const ArchiveProbe& probe, const std::string& path,
                           const std::string& volume, const ProbeOptions& opts, int retries) {
  for (int attempt = 0;; ++attempt) {
    try {
      return probe(path, volume, opts);
    } catch (const CatalogError& e) {
      if (!e.retryable() || attempt >= retries) throw;
      spdlog::warn("retrying {} after I/O failure ({}/{}): {}", path, attempt + 1, retries, e.what());
    }
  }
}

void runScanJob(ScanJob& job, const JobContext& ctx) {
  const auto& vol = job.volume;
  if (auto why = VolumeWalker::checkRoot(vol.root)) {
    throw CatalogError(ErrorCode::IOFailure, *why);
  }

  const auto t0 = std::chrono::steady_clock::now();
  auto elapsed = [&] {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  };
  Heartbeat heartbeat(ctx.heartbeat_interval);

  ProbeOptions opts;
  opts.categories = vol.policy.categories;
  opts.hash_contents = vol.policy.hash_contents;

  VolumeWalker walker(vol.root, vol.policy);
  while (auto item = walker.next()) {
    if (ctx.cancelled.load()) {
      job.interrupted = true;
      return;
    }
    if (item->skipped()) {
      spdlog::warn("[{}] skipped {}: {}", vol.label, item->path.string(), *item->skip_reason);
      job.failures.push_back({item->path.string(), "Skipped", *item->skip_reason});
      continue;
    }

    const std::string path = item->path.string();
    ++job.archives_seen;
    try {
      auto res = probeWithRetry(ctx.probe, path, vol.label, opts, ctx.probe_retries);
      if (!res.entries.empty()) {
        job.store->insertProbe(res.archive, res.entries);
        ++job.archives;
        job.entries += static_cast<int64_t>(res.entries.size());
      }
      ProgressEvent ev;
      ev.kind = ProgressKind::ArchiveIndexed;
      ev.job_id = vol.label;
      ev.archives = job.archives;
      ev.entries = job.entries;
      ev.elapsed_seconds = elapsed();
      ev.current_file = path;
      ev.current_size = res.archive.size;
      ctx.progress.report(ev);
    } catch (const CatalogError& e) {
      if (e.code() == ErrorCode::StoreFailure) throw;  // the private store is unusable
      spdlog::warn("[{}] cannot index {}: {}", vol.label, path, e.what());
      job.failures.push_back({path, to_string(e.code()), e.what()});
    }

    if (heartbeat.due()) {
      ProgressEvent ev;
      ev.kind = ProgressKind::Heartbeat;
      ev.job_id = vol.label;
      ev.archives = job.archives;
      ev.entries = job.entries;
      ev.elapsed_seconds = elapsed();
      ev.current_file = path;
      ctx.progress.report(ev);
    }
  }
}

} // namespace zipcat
