#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Errors.hpp"
#include "core/archive/EntryReader.hpp"
#include "core/metadata/CatalogStore.hpp"
#include "core/scan/Progress.hpp"

namespace zipcat {

class LocalFSBackend;

enum class SelectorKind { NamePattern, ArchiveId, All };
const char* to_string(SelectorKind k);

struct ExtractionRequest {
  SelectorKind kind = SelectorKind::NamePattern;
  std::string  value;                         // pattern or archive id; unused for All
  bool         regex = false;                 // NamePattern only
  std::filesystem::path destination;
  std::optional<std::string> secondary_filter; // case-insensitive substring of entry_path
  bool         confirm_all = false;
};

enum class ExtractionStatus { Success, Failed };
const char* to_string(ExtractionStatus s);

struct ExtractionResult {
  std::string entry_path;
  std::string archive_id;
  std::optional<std::string> output_path;     // set on success
  ExtractionStatus status = ExtractionStatus::Failed;
  std::optional<ErrorCode>   error_code;
  std::optional<std::string> error;
  int64_t bytes_written = 0;
  double  duration_seconds = 0.0;
};

struct ExtractionReport {
  std::vector<ExtractionResult> results;     // same order as the input pairs
  double duration_seconds = 0.0;

  size_t succeeded() const;
  size_t failed() const;
  int64_t bytesWritten() const;
};

nlohmann::json toJson(const ExtractionReport& r);

// Picks among several candidates. Returns indices into `candidates`; an empty
// result means the user declined.
class SelectionPrompt {
public:
  virtual ~SelectionPrompt() = default;
  virtual std::vector<size_t> choose(const std::vector<CatalogMatch>& candidates) = 0;
};

struct ExtractOptions {
  size_t parallelism = 1;
  size_t chunk_size = 1 << 20;
  std::chrono::milliseconds progress_interval{2000};
};

// Streams catalog entries back out of their source archives. The catalog is
// only read.
class Extractor {
public:
  Extractor(const CatalogStore& catalog, ProgressReporter& progress,
            ExtractOptions options = {},
            EntryReaderFactory readers = zipEntryReaderFactory());

  // Throws CatalogError(NotFound) for an unknown archive id and
  // CatalogError(InvalidQuery) for an empty or malformed pattern.
  std::vector<CatalogMatch> resolve(const ExtractionRequest& request) const;

  // resolve() plus the selection rules, then extract(). All without
  // confirm_all throws ConfirmationRequired before touching the filesystem;
  // an ambiguous NamePattern without a prompt throws AmbiguousSelection.
  ExtractionReport run(const ExtractionRequest& request, SelectionPrompt* prompt = nullptr);

  // Per-pair failures land in the report; only an unusable destination throws.
  ExtractionReport extract(const std::vector<CatalogMatch>& pairs,
                           const std::filesystem::path& destination);

private:
  ExtractionResult extractOne(const CatalogMatch& pair, LocalFSBackend& out);

  const CatalogStore& catalog_;
  ProgressReporter&   progress_;
  ExtractOptions      options_;
  EntryReaderFactory  readers_;
};

} // namespace zipcat
