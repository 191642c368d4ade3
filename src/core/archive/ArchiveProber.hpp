#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "core/metadata/Records.hpp"

namespace zipcat {

struct ProbeOptions {
  CategorySet categories;      // empty = keep every entry
  bool hash_contents = false;  // SHA-256 of the archive bytes and of each entry payload
};

struct ProbeResult {
  ArchiveRecord            archive;
  std::vector<EntryRecord> entries;
  int64_t skipped_entries = 0;   // directories, zero-byte files, links
  int64_t filtered_entries = 0;  // outside the requested categories
};

// Lists a ZIP archive without extracting payloads. Mints the archive id.
// Throws CatalogError: CorruptArchive, UnsupportedArchive, IOFailure,
// PermissionDenied.
ProbeResult probeArchive(const std::string& path, const std::string& volume,
                         const ProbeOptions& options = {});

} // namespace zipcat
