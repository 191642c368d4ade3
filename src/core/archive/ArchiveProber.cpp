#include "ArchiveProber.hpp"

#include <filesystem>
#include <unordered_map>
#include <vector>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/archive/LibArchive.hpp"
#include "core/archive/ZipDirectory.hpp"
#include "core/util/Hash.hpp"
#include "core/util/Ids.hpp"

namespace zipcat {

namespace {

std::string baseName(const std::string& entryPath) {
  const auto slash = entryPath.find_last_of('/');
  return slash == std::string::npos ? entryPath : entryPath.substr(slash + 1);
}

// Second read of the archive: SHA-256 of each kept entry's payload.
void hashEntries(const std::string& path, std::vector<EntryRecord>& entries) {
  std::unordered_map<std::string, EntryRecord*> byPath;
  for (auto& e : entries) byPath[e.entry_path] = &e;

  auto a = openZipForRead(path);
  archive_entry* ae = nullptr;
  std::vector<char> buf(1 << 16);
  int rc;
  while ((rc = archive_read_next_header(a.get(), &ae)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
    const char* name = entryPathname(ae);
    auto it = name ? byPath.find(name) : byPath.end();
    if (it == byPath.end()) {
      if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
        throwArchiveError(a.get(), path, "cannot skip entry data in");
      }
      continue;
    }
    Sha256 h;
    la_ssize_t n;
    while ((n = archive_read_data(a.get(), buf.data(), buf.size())) > 0) {
      h.update(buf.data(), static_cast<size_t>(n));
    }
    if (n < 0) throwArchiveError(a.get(), path, "cannot read entry data of");
    it->second->content_hash = h.hexdigest();
  }
  if (rc != ARCHIVE_EOF) throwArchiveError(a.get(), path, "cannot read entry header of");
}

} // namespace

ProbeResult probeArchive(const std::string& path, const std::string& volume, const ProbeOptions& options) {
  namespace fs = std::filesystem;

  std::error_code ec;
  const auto st = fs::status(path, ec);
  if (ec) {
    const auto code = ec == std::errc::permission_denied ? ErrorCode::PermissionDenied : ErrorCode::IOFailure;
    throw CatalogError(code, "cannot stat " + path + ": " + ec.message());
  }
  if (!fs::is_regular_file(st)) {
    throw CatalogError(ErrorCode::UnsupportedArchive, "not a regular file: " + path);
  }
  const auto fileSize = fs::file_size(path, ec);
  if (ec) throw CatalogError(ErrorCode::IOFailure, "cannot size " + path + ": " + ec.message());
  const auto mtime = fs::last_write_time(path, ec);
  if (ec) throw CatalogError(ErrorCode::IOFailure, "cannot stat " + path + ": " + ec.message());

  ProbeResult res;
  res.archive.id          = uuid4();
  res.archive.source_path = fs::absolute(path).lexically_normal().string();
  res.archive.volume      = volume;
  res.archive.size        = static_cast<int64_t>(fileSize);
  res.archive.modified_at = file_time_to_epoch(mtime);
  res.archive.scanned_at  = now_epoch();

  auto a = openZipForRead(path);
  const auto compressed = compressedSizes(path);

  archive_entry* ae = nullptr;
  int rc;
  while ((rc = archive_read_next_header(a.get(), &ae)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
    if (rc == ARCHIVE_WARN) {
      spdlog::warn("{}: {}", path, archive_error_string(a.get()) ? archive_error_string(a.get()) : "warning");
    }
    const char* name = entryPathname(ae);
    if (!name) spdlog::warn("{}: skipping an entry whose name cannot be decoded", path);
    const bool isFile = archive_entry_filetype(ae) == AE_IFREG;
    const int64_t size = archive_entry_size_is_set(ae) ? archive_entry_size(ae) : 0;

    if (!name || !isFile || size == 0) {
      ++res.skipped_entries;
    } else {
      EntryRecord e;
      e.archive_id  = res.archive.id;
      e.entry_path  = name;
      e.name        = baseName(e.entry_path);
      e.size        = size;
      e.modified_at = archive_entry_mtime_is_set(ae) ? static_cast<int64_t>(archive_entry_mtime(ae)) : 0;
      e.category    = detect_category(e.entry_path);
      if (auto it = compressed.find(e.entry_path); it != compressed.end()) e.compressed_size = it->second;

      if (!options.categories.empty() && options.categories.count(e.category) == 0) {
        ++res.filtered_entries;
      } else {
        res.entries.push_back(std::move(e));
      }
    }
    // listing only: never inflate payloads here
    if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
      throwArchiveError(a.get(), path, "cannot skip entry data in");
    }
  }
  if (rc != ARCHIVE_EOF) throwArchiveError(a.get(), path, "cannot read entry header of");
  a.reset();

  if (options.hash_contents) {
    res.archive.content_hash = sha256_file(path);
    if (!res.entries.empty()) hashEntries(path, res.entries);
  }
  return res;
}

} // namespace zipcat
