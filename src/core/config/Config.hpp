#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>

#include "core/scan/ScanCoordinator.hpp"
#include "core/scan/ScanJob.hpp"
#include "core/scan/VolumeWalker.hpp"

namespace zipcat {

struct VolumeEntry {
  std::string label;
  std::string root;
};

struct AppConfig {
  std::string database_path = "data/zipcatalog.db";
  size_t max_workers = 4;
  bool google_takeout_mode = true;
  std::vector<std::string> marker_folders{"GoogleTakeout"};
  bool scan_all_files = false;                    // ignore `categories`
  std::vector<std::string> categories{"video"};
  std::vector<std::string> excluded_directories{
    "proc", "sys", "dev", "run", "lost+found", "$RECYCLE.BIN", "System Volume Information"
  };
  bool compute_hashes = false;
  int probe_retries = 2;
  std::string temp_dir;                           // empty = next to the database
  size_t extract_parallelism = 1;
  int progress_interval_ms = 2000;
  std::string log_level = "info";
  std::vector<VolumeEntry> volumes;               // empty = mounted volumes
  int http_port = 8080;
  std::string api_key;                            // empty = auth disabled
};

// Environment lookup with a fallback.
std::string get_env_or(const char* key, const std::string& defval);

// Unknown keys are ignored; wrong types throw std::runtime_error.
AppConfig parseConfig(const nlohmann::json& j);

// `path` set: the file must exist. Otherwise ./config.json is used when
// present, else the defaults. Environment overrides are applied last.
AppConfig loadConfig(const std::optional<std::string>& path);

// ZIPCAT_DB_PATH, ZIPCAT_PORT, ZIPCAT_API_KEY, ZIPCAT_LOG_LEVEL
void applyEnvOverrides(AppConfig& cfg);

// spdlog level by name ("trace" .. "critical", "off"). Throws
// std::runtime_error for anything else.
spdlog::level::level_enum parseLogLevel(const std::string& name);

// Throws std::runtime_error for an unknown category name.
InclusionPolicy makePolicy(const AppConfig& cfg);
ScanOptions makeScanOptions(const AppConfig& cfg);

// Configured volumes, or the mount points found under /mnt and /media
// (falling back to "/") when none are configured.
std::vector<VolumeSpec> makeVolumes(const AppConfig& cfg);
std::vector<VolumeEntry> enumerateMountedVolumes();

// "label=path"; a bare path takes its last component as the label.
VolumeEntry parseVolumeArg(const std::string& arg);

} // namespace zipcat
