#include "Progress.hpp"

#include <spdlog/spdlog.h>

namespace zipcat {

const char* to_string(ProgressKind k) {
  switch (k) {
    case ProgressKind::Heartbeat:      return "heartbeat";
    case ProgressKind::ArchiveIndexed: return "archive";
    case ProgressKind::JobFinished:    return "job";
    case ProgressKind::Merged:         return "merge";
    case ProgressKind::Extracting:     return "extracting";
    case ProgressKind::Extracted:      return "extracted";
  }
  return "event";
}

static double mb(int64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

void LogProgressReporter::report(const ProgressEvent& ev) {
  const std::string file = ev.current_file.value_or("");
  switch (ev.kind) {
    case ProgressKind::Heartbeat:
      spdlog::info("[{:<8}] {} archives, {} entries ({:.1f}s) {}",
                   ev.job_id, ev.archives, ev.entries, ev.elapsed_seconds, file);
      break;
    case ProgressKind::ArchiveIndexed:
      spdlog::debug("[{:<8}] indexed {} ({:.1f} MB), {} entries so far",
                    ev.job_id, file, mb(ev.current_size.value_or(0)), ev.entries);
      break;
    case ProgressKind::JobFinished:
      spdlog::info("[{:<8}] COMPLETE: {} archives, {} entries ({:.1f}s)",
                   ev.job_id, ev.archives, ev.entries, ev.elapsed_seconds);
      break;
    case ProgressKind::Merged:
      spdlog::info("[MERGE] {}: {} archives, {} entries ({:.2f}s)",
                   ev.job_id, ev.archives, ev.entries, ev.elapsed_seconds);
      break;
    case ProgressKind::Extracting:
      spdlog::info("[EXTRACT] {}: {:.1f} MB @ {:.1f} MB/s",
                   file, mb(ev.bytes), ev.bytes_per_second / (1024.0 * 1024.0));
      break;
    case ProgressKind::Extracted:
      spdlog::info("[EXTRACT] {} complete: {:.1f} MB in {:.1f}s", file, mb(ev.bytes), ev.elapsed_seconds);
      break;
  }
}

} // namespace zipcat
