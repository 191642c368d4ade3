#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/metadata/Records.hpp"

namespace zipcat {

// SQLite-backed catalog of archives and their entries.
//
// Every instance owns one connection and one backing file. Isolated
// instances are per-scan-job scratch stores: their file is deleted by
// dispose(). Calls on one instance are serialized by an internal mutex.
class CatalogStore {
public:
  explicit CatalogStore(const std::string& dbPath, bool isolated = false);
  ~CatalogStore();
  CatalogStore(const CatalogStore&) = delete;
  CatalogStore& operator=(const CatalogStore&) = delete;

  // Allocates a fresh store under `dir` whose file name is unique per call.
  static std::unique_ptr<CatalogStore> createIsolated(const std::filesystem::path& dir,
                                                      const std::string& tag);

  const std::string& path() const { return path_; }
  bool isolated() const { return isolated_; }

  // Upsert by (source_path, volume). Returns the id that is stored, which is
  // the pre-existing one when the key was already present.
  std::string insertArchive(const ArchiveRecord& r);
  // Upsert by (archive_id, entry_path); one transaction for the batch.
  void insertEntries(const std::string& archiveId, const std::vector<EntryRecord>& entries);
  // Archive and entries in a single transaction.
  std::string insertProbe(const ArchiveRecord& r, const std::vector<EntryRecord>& entries);

  // Imports every record of `other` in one transaction; all or nothing.
  // Throws CatalogError(MergeConflict) if an archive id is already used by a
  // different (source_path, volume).
  MergeSummary mergeFrom(CatalogStore& other);

  std::vector<CatalogMatch> query(const QueryFilter& filter) const;
  std::optional<ArchiveRecord> archive(const std::string& id) const;
  std::vector<ArchiveListing> listArchives(std::optional<int64_t> limit = std::nullopt) const;
  CatalogStats stats() const;
  // Archives, entries and bytes per volume label, ordered by label.
  std::vector<VolumeStats> volumeStats() const;
  // Entries sharing a content hash; only hashed entries take part.
  std::vector<DuplicateGroup> duplicateEntries() const;

  // Closes the connection; isolated stores also lose their files.
  void dispose();
  bool disposed() const;

private:
  void* handle() const; // sqlite3*, throws once disposed
  std::string insertArchiveLocked(const ArchiveRecord& r);
  void insertEntriesLocked(const std::string& archiveId, const std::vector<EntryRecord>& entries);

  void* db_; // sqlite3*
  std::string path_;
  bool isolated_;
  mutable std::mutex mu_;
};

} // namespace zipcat
