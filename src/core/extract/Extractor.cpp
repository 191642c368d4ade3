#include "Extractor.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/storage/LocalFSBackend.hpp"
#include "core/util/WorkerPool.hpp"

namespace zipcat {

using nlohmann::json;

const char* to_string(SelectorKind k) {
  switch (k) {
    case SelectorKind::NamePattern: return "name";
    case SelectorKind::ArchiveId:   return "archive";
    case SelectorKind::All:         return "all";
  }
  return "unknown";
}

const char* to_string(ExtractionStatus s) {
  return s == ExtractionStatus::Success ? "success" : "failed";
}

size_t ExtractionReport::succeeded() const {
  return static_cast<size_t>(std::count_if(results.begin(), results.end(), [](const ExtractionResult& r) {
    return r.status == ExtractionStatus::Success;
  }));
}

size_t ExtractionReport::failed() const { return results.size() - succeeded(); }

int64_t ExtractionReport::bytesWritten() const {
  int64_t n = 0;
  for (const auto& r : results) n += r.bytes_written;
  return n;
}

json toJson(const ExtractionReport& r) {
  json items = json::array();
  for (const auto& x : r.results) {
    json j = {
      {"entry_path", x.entry_path},
      {"archive_id", x.archive_id},
      {"status", to_string(x.status)},
      {"bytes_written", x.bytes_written},
      {"duration", x.duration_seconds}
    };
    if (x.output_path) j["output_path"] = *x.output_path;
    if (x.error_code)  j["error_code"] = to_string(*x.error_code);
    if (x.error)       j["error"] = *x.error;
    items.push_back(std::move(j));
  }
  return {
    {"results", items},
    {"succeeded", r.succeeded()},
    {"failed", r.failed()},
    {"bytes_written", r.bytesWritten()},
    {"duration", r.duration_seconds}
  };
}

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string outputName(const EntryRecord& e) {
  std::string n = e.name;
  if (n.empty()) {
    const auto slash = e.entry_path.find_last_of('/');
    n = slash == std::string::npos ? e.entry_path : e.entry_path.substr(slash + 1);
  }
  if (n.empty() || n == "." || n == "..") n = "entry";
  return n;
}

double secondsSince(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

Extractor::Extractor(const CatalogStore& catalog, ProgressReporter& progress,
                     ExtractOptions options, EntryReaderFactory readers)
  : catalog_(catalog), progress_(progress), options_(options), readers_(std::move(readers)) {
  if (options_.parallelism == 0) options_.parallelism = 1;
  if (options_.chunk_size == 0) options_.chunk_size = 1 << 20;
}

// -------- resolution --------

std::vector<CatalogMatch> Extractor::resolve(const ExtractionRequest& req) const {
  QueryFilter f;
  switch (req.kind) {
    case SelectorKind::NamePattern:
      if (req.value.empty()) throw CatalogError(ErrorCode::InvalidQuery, "empty name pattern");
      if (req.regex) f.regex = req.value; else f.name = req.value;
      break;
    case SelectorKind::ArchiveId:
      if (!catalog_.archive(req.value)) {
        throw CatalogError(ErrorCode::NotFound, "no archive with id " + req.value);
      }
      f.archive_id = req.value;
      break;
    case SelectorKind::All:
      break;
  }

  auto matches = catalog_.query(f);
  if (req.secondary_filter && !req.secondary_filter->empty()) {
    const std::string needle = lower(*req.secondary_filter);
    matches.erase(std::remove_if(matches.begin(), matches.end(), [&](const CatalogMatch& m) {
      return lower(m.entry.entry_path).find(needle) == std::string::npos;
    }), matches.end());
  }
  return matches;
}

ExtractionReport Extractor::run(const ExtractionRequest& req, SelectionPrompt* prompt) {
  if (req.kind == SelectorKind::All && !req.confirm_all) {
    throw CatalogError(ErrorCode::ConfirmationRequired,
                       "extracting the entire catalog requires explicit confirmation");
  }

  auto matches = resolve(req);
  if (matches.empty()) {
    spdlog::warn("no entries match {} selector '{}'", to_string(req.kind), req.value);
    return {};
  }

  if (req.kind == SelectorKind::NamePattern && matches.size() > 1) {
    if (!prompt) {
      throw CatalogError(ErrorCode::AmbiguousSelection,
                         std::to_string(matches.size()) + " entries match '" + req.value +
                         "'; narrow the pattern or choose interactively");
    }
    const auto picked = prompt->choose(matches);
    if (picked.empty()) {
      spdlog::info("selection cancelled; nothing extracted");
      return {};
    }
    std::vector<CatalogMatch> chosen;
    chosen.reserve(picked.size());
    for (size_t i : picked) {
      if (i >= matches.size()) {
        throw CatalogError(ErrorCode::InvalidQuery, "selection " + std::to_string(i + 1) + " is out of range");
      }
      chosen.push_back(matches[i]);
    }
    matches = std::move(chosen);
  }

  spdlog::info("extracting {} entries to {}", matches.size(), req.destination.string());
  return extract(matches, req.destination);
}

// -------- streaming --------

ExtractionResult Extractor::extractOne(const CatalogMatch& m, LocalFSBackend& out) {
  ExtractionResult r;
  r.entry_path = m.entry.entry_path;
  r.archive_id = m.archive.id;
  const auto t0 = std::chrono::steady_clock::now();

  try {
    auto reader = readers_(m.archive, m.entry);
    StagedFile file = out.create(outputName(m.entry));

    std::vector<char> buf(options_.chunk_size);
    Heartbeat hb(options_.progress_interval);
    hb.due();
    for (;;) {
      const size_t n = reader->read(buf.data(), buf.size());
      if (n == 0) break;
      file.write(buf.data(), n);
      if (hb.due()) {
        ProgressEvent ev;
        ev.kind = ProgressKind::Extracting;
        ev.job_id = "extract";
        ev.current_file = m.entry.entry_path;
        ev.current_size = m.entry.size;
        ev.bytes = file.bytes();
        ev.elapsed_seconds = secondsSince(t0);
        ev.bytes_per_second = ev.elapsed_seconds > 0 ? static_cast<double>(file.bytes()) / ev.elapsed_seconds : 0.0;
        progress_.report(ev);
      }
    }
    if (file.bytes() != m.entry.size) {
      throw CatalogError(ErrorCode::CorruptArchive,
                         "size mismatch for " + m.entry.entry_path + ": expected " +
                         std::to_string(m.entry.size) + " bytes, got " + std::to_string(file.bytes()));
    }
    file.commit();

    r.status = ExtractionStatus::Success;
    r.output_path = file.path().string();
    r.bytes_written = file.bytes();
  } catch (const CatalogError& e) {
    r.error_code = e.code();
    r.error = e.what();
  } catch (const std::exception& e) {
    r.error_code = ErrorCode::IOFailure;
    r.error = e.what();
  }
  r.duration_seconds = secondsSince(t0);

  if (r.status == ExtractionStatus::Success) {
    ProgressEvent ev;
    ev.kind = ProgressKind::Extracted;
    ev.job_id = "extract";
    ev.current_file = r.output_path;
    ev.bytes = r.bytes_written;
    ev.elapsed_seconds = r.duration_seconds;
    progress_.report(ev);
  } else {
    spdlog::error("[EXTRACT] {} ({}): {}", r.entry_path, m.archive.source_path, r.error.value_or(""));
  }
  return r;
}

ExtractionReport Extractor::extract(const std::vector<CatalogMatch>& pairs,
                                    const std::filesystem::path& destination) {
  const auto t0 = std::chrono::steady_clock::now();
  ExtractionReport report;
  if (pairs.empty()) return report;

  LocalFSBackend out(destination);
  out.ensureRoot();
  report.results.resize(pairs.size());

  // Pairs touch disjoint output files and open their own archive handles.
  std::atomic<size_t> cursor{0};
  auto worker = [&] {
    for (;;) {
      const size_t i = cursor.fetch_add(1);
      if (i >= pairs.size()) return;
      report.results[i] = extractOne(pairs[i], out);
    }
  };

  runWorkers(std::min(options_.parallelism, pairs.size()), worker);

  report.duration_seconds = secondsSince(t0);
  spdlog::info("extraction finished: {} succeeded, {} failed, {:.1f} MB ({:.1f}s)",
               report.succeeded(), report.failed(),
               static_cast<double>(report.bytesWritten()) / (1024.0 * 1024.0), report.duration_seconds);
  return report;
}

} // namespace zipcat
