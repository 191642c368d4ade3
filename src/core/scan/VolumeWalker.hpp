#pragma once
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/util/Category.hpp"

namespace zipcat {

enum class ScanMode {
  MarkerFolders,   // only inside marker directories found directly under the root
  FullVolume       // whole tree, minus excluded directory names
};

struct InclusionPolicy {
  ScanMode mode = ScanMode::MarkerFolders;
  std::vector<std::string> marker_names{"GoogleTakeout"};  // compared case-insensitively
  std::set<std::string> excluded_dirs;                     // compared exactly, by name
  CategorySet categories;                                  // entry categories to index; empty = all
  bool hash_contents = false;
};

struct WalkItem {
  std::filesystem::path path;
  std::optional<std::string> skip_reason;  // set when `path` could not be visited

  bool skipped() const { return skip_reason.has_value(); }
};

// Lazy depth-first discovery of *.zip files under a root. Symlinks are
// never followed. Unreadable directories come out as skip items.
class VolumeWalker {
public:
  VolumeWalker(std::filesystem::path root, InclusionPolicy policy);

  std::optional<WalkItem> next();
  void reset();  // start over from the root

  // Empty when the root is a readable directory, otherwise the reason.
  static std::optional<std::string> checkRoot(const std::filesystem::path& root);

private:
  void pushDir(const std::filesystem::path& dir);
  bool isMarker(const std::string& name) const;
  void seedMarkers();

  std::filesystem::path root_;
  InclusionPolicy policy_;
  std::vector<std::filesystem::directory_iterator> stack_;
  std::vector<WalkItem> pending_;
  bool seeded_ = false;
};

} // namespace zipcat
