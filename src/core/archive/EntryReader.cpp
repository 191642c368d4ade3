#include "EntryReader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include "core/Errors.hpp"
#include "core/archive/LibArchive.hpp"

namespace zipcat {

namespace {

class ZipEntryReader : public EntryReader {
public:
  ZipEntryReader(ArchivePtr a, std::string archivePath)
    : a_(std::move(a)), archivePath_(std::move(archivePath)) {}

  size_t read(char* buf, size_t len) override {
    const la_ssize_t n = archive_read_data(a_.get(), buf, len);
    if (n < 0) throwArchiveError(a_.get(), archivePath_, "cannot read entry data of");
    return static_cast<size_t>(n);
  }

private:
  ArchivePtr a_;
  std::string archivePath_;
};

} // namespace

std::unique_ptr<EntryReader> openZipEntry(const std::string& archivePath, const std::string& entryPath) {
  auto a = openZipForRead(archivePath);
  archive_entry* ae = nullptr;
  int rc;
  while ((rc = archive_read_next_header(a.get(), &ae)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
    const char* name = entryPathname(ae);
    if (name && entryPath == name) {
      return std::make_unique<ZipEntryReader>(std::move(a), archivePath);
    }
    if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
      throwArchiveError(a.get(), archivePath, "cannot skip entry data in");
    }
  }
  if (rc != ARCHIVE_EOF) throwArchiveError(a.get(), archivePath, "cannot read entry header of");
  throw CatalogError(ErrorCode::NotFound, "entry '" + entryPath + "' not found in " + archivePath);
}

EntryReaderFactory zipEntryReaderFactory() {
  return [](const ArchiveRecord& archive, const EntryRecord& entry) {
    return openZipEntry(archive.source_path, entry.entry_path);
  };
}

} // namespace zipcat
