#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "core/metadata/Records.hpp"

namespace zipcat {

// Sequential reader over one entry's decompressed bytes.
class EntryReader {
public:
  virtual ~EntryReader() = default;
  // Fills up to `len` bytes; returns 0 at end of entry. Throws CatalogError.
  virtual size_t read(char* buf, size_t len) = 0;
};

using EntryReaderFactory =
  std::function<std::unique_ptr<EntryReader>(const ArchiveRecord&, const EntryRecord&)>;

// libarchive-backed reader positioned on `entryPath`.
// Throws CatalogError(NotFound) if the archive no longer holds it.
std::unique_ptr<EntryReader> openZipEntry(const std::string& archivePath, const std::string& entryPath);

EntryReaderFactory zipEntryReaderFactory();

} // namespace zipcat
