#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "core/scan/Progress.hpp"

namespace zipcat::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
  std::filesystem::path path_;
};

struct ZipItem {
  std::string name;
  std::string data;
  bool directory = false;
};

// Writes a ZIP with libarchive's writer; parent directories are created.
void writeZip(const std::filesystem::path& path, const std::vector<ZipItem>& items);
void writeFile(const std::filesystem::path& path, const std::string& data);
std::string readFile(const std::filesystem::path& path);

// Every regular file below `dir`, relative and sorted.
std::vector<std::string> listFiles(const std::filesystem::path& dir);

class RecordingReporter : public ProgressReporter {
public:
  void report(const ProgressEvent& ev) override {
    std::lock_guard<std::mutex> lk(mu_);
    events_.push_back(ev);
  }
  std::vector<ProgressEvent> events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
  }
  size_t count(ProgressKind kind) const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (const auto& e : events_) n += e.kind == kind ? 1 : 0;
    return n;
  }

private:
  mutable std::mutex mu_;
  std::vector<ProgressEvent> events_;
};

} // namespace zipcat::test
