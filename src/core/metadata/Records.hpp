#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/util/Category.hpp"

namespace zipcat {

struct ArchiveRecord {
  std::string id;            // UUIDv4 minted at probe time, never reassigned
  std::string source_path;   // absolute
  std::string volume;
  int64_t     size = 0;
  std::optional<std::string> content_hash;
  int64_t     modified_at = 0;
  int64_t     scanned_at = 0;
};

struct EntryRecord {
  std::string archive_id;
  std::string entry_path;    // path inside the archive
  std::string name;          // base name of entry_path
  int64_t     size = 0;      // uncompressed
  int64_t     compressed_size = 0;
  int64_t     modified_at = 0;
  std::optional<std::string> content_hash;
  Category    category = Category::Other;
};

struct CatalogMatch {
  ArchiveRecord archive;
  EntryRecord   entry;
};

struct QueryFilter {
  std::optional<std::string> name;     // case-insensitive substring of entry_path
  std::optional<std::string> regex;    // ECMAScript, searched in entry_path
  std::optional<int64_t>     min_size;
  std::optional<int64_t>     max_size;
  CategorySet                categories;  // empty = any
  std::optional<std::string> archive_id;
  std::optional<int64_t>     limit;
};

// Every video entry in catalog order.
inline QueryFilter videoFilter(std::optional<int64_t> limit = std::nullopt) {
  QueryFilter f;
  f.categories = {Category::Video};
  f.limit = limit;
  return f;
}

struct MergeSummary {
  int64_t archives_merged = 0;
  int64_t entries_merged = 0;
  int64_t archives_skipped = 0;   // natural key already present
  int64_t entries_skipped = 0;
  double  elapsed_seconds = 0.0;
};

struct ArchiveListing {
  ArchiveRecord archive;
  int64_t       entry_count = 0;
};

struct CatalogStats {
  int64_t volumes = 0;
  int64_t archives = 0;
  int64_t entries = 0;
  int64_t total_bytes = 0;
};

// One row of the per-volume breakdown.
struct VolumeStats {
  std::string volume;
  int64_t archives = 0;
  int64_t entries = 0;
  int64_t total_bytes = 0;
};

struct DuplicateGroup {
  std::string               content_hash;
  int64_t                   size = 0;
  std::vector<CatalogMatch> members;
};

} // namespace zipcat
