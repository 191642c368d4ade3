#include "LocalFSBackend.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace zipcat {

namespace fs = std::filesystem;

// -------- StagedFile --------

StagedFile::StagedFile(fs::path path, std::ofstream os)
  : path_(std::move(path)), os_(std::move(os)) {}

StagedFile::StagedFile(StagedFile&& other) noexcept
  : path_(std::move(other.path_)), os_(std::move(other.os_)),
    bytes_(other.bytes_), committed_(other.committed_), live_(other.live_) {
  other.live_ = false;
}

StagedFile::~StagedFile() { discard(); }

void StagedFile::write(const char* data, size_t len) {
  os_.write(data, static_cast<std::streamsize>(len));
  if (!os_) throw CatalogError(ErrorCode::IOFailure, "write failed: " + path_.string());
  bytes_ += static_cast<int64_t>(len);
}

void StagedFile::commit() {
  os_.flush();
  os_.close();
  if (os_.fail()) throw CatalogError(ErrorCode::IOFailure, "cannot finish " + path_.string());
  committed_ = true;
}

void StagedFile::discard() noexcept {
  if (!live_ || committed_) return;
  live_ = false;
  if (os_.is_open()) os_.close();
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) spdlog::warn("could not remove partial file {}: {}", path_.string(), ec.message());
}

// -------- LocalFSBackend --------

void LocalFSBackend::ensureRoot() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec || !fs::is_directory(root_)) {
    throw CatalogError(ErrorCode::DestinationUnwritable,
                       "cannot create destination " + root_.string() +
                       (ec ? ": " + ec.message() : std::string()));
  }
}

std::string LocalFSBackend::suffixedName(const std::string& fileName, int n) {
  if (n == 0) return fileName;
  const fs::path p(fileName);
  const std::string ext = p.extension().string();
  const std::string stem = ext.empty() ? fileName : p.stem().string();
  return stem + "_" + std::to_string(n) + ext;
}

StagedFile LocalFSBackend::create(const std::string& fileName) {
  std::lock_guard<std::mutex> lock(mu_);
  ensureRoot();

  for (int n = 0;; ++n) {
    const std::string candidate = suffixedName(fileName, n);
    if (reserved_.count(candidate)) continue;
    const fs::path target = root_ / candidate;
    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec))) continue;

    std::ofstream os(target, std::ios::binary | std::ios::trunc);
    if (!os) {
      throw CatalogError(ErrorCode::DestinationUnwritable, "cannot create " + target.string());
    }
    reserved_.insert(candidate);
    return StagedFile(target, std::move(os));
  }
}

} // namespace zipcat
