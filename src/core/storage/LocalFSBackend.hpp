#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>

namespace zipcat {

// One output file being written. Removed on destruction unless commit()
// succeeded, so an interrupted stream never leaves a partial file behind.
class StagedFile {
public:
  StagedFile(std::filesystem::path path, std::ofstream os);
  ~StagedFile();
  StagedFile(StagedFile&& other) noexcept;
  StagedFile& operator=(StagedFile&&) = delete;
  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  // Throws CatalogError(IOFailure) on a short write.
  void write(const char* data, size_t len);
  // Flushes and closes. Throws CatalogError(IOFailure); the file is then discarded.
  void commit();
  // Drops the file now; a no-op after commit().
  void discard() noexcept;

  const std::filesystem::path& path() const { return path_; }
  int64_t bytes() const { return bytes_; }
  bool committed() const { return committed_; }

private:
  std::filesystem::path path_;
  std::ofstream os_;
  int64_t bytes_ = 0;
  bool committed_ = false;
  bool live_ = true;
};

// Writes extracted files under one destination directory. Output names are
// never reused: a taken name becomes `stem_1.ext`, `stem_2.ext`, ...
class LocalFSBackend {
public:
  explicit LocalFSBackend(std::filesystem::path root) : root_(std::move(root)) {}

  const std::filesystem::path& root() const { return root_; }

  // Creates the destination directory. Throws CatalogError(DestinationUnwritable).
  void ensureRoot();

  // Picks the first free name for `fileName` and creates it empty, so two
  // callers never receive the same path. Throws CatalogError(DestinationUnwritable).
  StagedFile create(const std::string& fileName);

  // Candidate for the n-th collision of `fileName` (0 = the name itself).
  static std::string suffixedName(const std::string& fileName, int n);

private:
  std::filesystem::path root_;
  std::mutex mu_;
  std::set<std::string> reserved_;   // names handed out by this instance
};

} // namespace zipcat
