#include "VolumeWalker.hpp"

#include <algorithm>
#include <cctype>

namespace zipcat {

namespace fs = std::filesystem;

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static WalkItem skip(const fs::path& p, const std::error_code& ec) {
  return WalkItem{p, ec.message()};
}

VolumeWalker::VolumeWalker(fs::path root, InclusionPolicy policy)
  : root_(std::move(root)), policy_(std::move(policy)) {}

void VolumeWalker::reset() {
  stack_.clear();
  pending_.clear();
  seeded_ = false;
}

std::optional<std::string> VolumeWalker::checkRoot(const fs::path& root) {
  std::error_code ec;
  const auto st = fs::status(root, ec);
  if (ec) return "cannot access " + root.string() + ": " + ec.message();
  if (!fs::is_directory(st)) return root.string() + " is not a directory";
  fs::directory_iterator probe(root, ec);
  if (ec) return "cannot list " + root.string() + ": " + ec.message();
  return std::nullopt;
}

bool VolumeWalker::isMarker(const std::string& name) const {
  const auto n = lower(name);
  return std::any_of(policy_.marker_names.begin(), policy_.marker_names.end(),
                     [&](const std::string& m) { return lower(m) == n; });
}

void VolumeWalker::pushDir(const fs::path& dir) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    pending_.push_back(skip(dir, ec));
    return;
  }
  stack_.push_back(std::move(it));
}

void VolumeWalker::seedMarkers() {
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  if (ec) {
    pending_.push_back(skip(root_, ec));
    return;
  }
  std::vector<fs::path> markers;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code tec;
    if (it->is_directory(tec) && !it->is_symlink(tec) && isMarker(it->path().filename().string())) {
      markers.push_back(it->path());
    }
  }
  if (ec) pending_.push_back(skip(root_, ec));
  // pushed in reverse so the first marker (by name) is walked first
  std::sort(markers.begin(), markers.end(), std::greater<fs::path>());
  for (const auto& m : markers) pushDir(m);
}

std::optional<WalkItem> VolumeWalker::next() {
  if (!seeded_) {
    seeded_ = true;
    if (policy_.mode == ScanMode::MarkerFolders) seedMarkers();
    else pushDir(root_);
  }

  while (true) {
    if (!pending_.empty()) {
      auto item = std::move(pending_.back());
      pending_.pop_back();
      return item;
    }
    if (stack_.empty()) return std::nullopt;

    auto& it = stack_.back();
    if (it == fs::directory_iterator()) {
      stack_.pop_back();
      continue;
    }

    const fs::directory_entry entry = *it;
    std::error_code ec;
    it.increment(ec);
    if (ec) {
      // The listing of this directory broke off; report and leave it.
      pending_.push_back(skip(entry.path().parent_path(), ec));
      stack_.pop_back();
    }

    std::error_code tec;
    if (entry.is_symlink(tec)) continue;
    if (entry.is_directory(tec)) {
      if (policy_.mode == ScanMode::FullVolume &&
          policy_.excluded_dirs.count(entry.path().filename().string())) {
        continue;
      }
      pushDir(entry.path());
      continue;
    }

    if (tec) {
      pending_.push_back(skip(entry.path(), tec));
      continue;
    }
    if (entry.is_regular_file(tec) && lower(entry.path().extension().string()) == ".zip") {
      return WalkItem{entry.path(), std::nullopt};
    }
  }
}

} // namespace zipcat
