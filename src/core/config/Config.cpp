#include "Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace zipcat {

namespace fs = std::filesystem;
using nlohmann::json;

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

// -------- parsing --------

AppConfig parseConfig(const json& j) {
  if (!j.is_object()) throw std::runtime_error("config: top level must be an object");
  AppConfig c;
  try {
    c.database_path        = j.value("database_path", c.database_path);
    c.max_workers          = j.value("max_workers", c.max_workers);
    c.google_takeout_mode  = j.value("google_takeout_mode", c.google_takeout_mode);
    c.marker_folders       = j.value("marker_folders", c.marker_folders);
    c.scan_all_files       = j.value("scan_all_files", c.scan_all_files);
    c.categories           = j.value("categories", c.categories);
    c.excluded_directories = j.value("excluded_directories", c.excluded_directories);
    c.compute_hashes       = j.value("compute_hashes", c.compute_hashes);
    c.probe_retries        = j.value("probe_retries", c.probe_retries);
    c.temp_dir             = j.value("temp_dir", c.temp_dir);
    c.extract_parallelism  = j.value("extract_parallelism", c.extract_parallelism);
    c.progress_interval_ms = j.value("progress_interval_ms", c.progress_interval_ms);
    c.log_level            = j.value("log_level", c.log_level);
    c.http_port            = j.value("http_port", c.http_port);
    c.api_key              = j.value("api_key", c.api_key);

    if (j.contains("volumes")) {
      for (const auto& v : j.at("volumes")) {
        VolumeEntry e{v.value("label", std::string()), v.at("root").get<std::string>()};
        if (e.root.empty()) throw std::runtime_error("config: volume root must not be empty");
        if (e.label.empty()) e.label = fs::path(e.root).filename().string();
        if (e.label.empty()) e.label = e.root;
        c.volumes.push_back(std::move(e));
      }
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  parseLogLevel(c.log_level);
  if (c.max_workers == 0) c.max_workers = 1;
  if (c.extract_parallelism == 0) c.extract_parallelism = 1;
  if (c.probe_retries < 0) c.probe_retries = 0;
  return c;
}

AppConfig loadConfig(const std::optional<std::string>& path) {
  std::string file;
  if (path) {
    if (!fs::exists(*path)) throw std::runtime_error("config file not found: " + *path);
    file = *path;
  } else if (fs::exists("config.json")) {
    file = "config.json";
  }

  AppConfig cfg;
  if (!file.empty()) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("cannot read config file: " + file);
    json j;
    try {
      in >> j;
    } catch (const json::parse_error& e) {
      throw std::runtime_error("malformed config file " + file + ": " + e.what());
    }
    cfg = parseConfig(j);
    spdlog::debug("loaded config from {}", file);
  }
  applyEnvOverrides(cfg);
  return cfg;
}

void applyEnvOverrides(AppConfig& cfg) {
  cfg.database_path = get_env_or("ZIPCAT_DB_PATH", cfg.database_path);
  cfg.api_key       = get_env_or("ZIPCAT_API_KEY", cfg.api_key);

  const std::string level = get_env_or("ZIPCAT_LOG_LEVEL", "");
  if (!level.empty()) {
    try {
      parseLogLevel(level);
      cfg.log_level = level;
    } catch (const std::runtime_error&) {
      spdlog::warn("ignoring invalid ZIPCAT_LOG_LEVEL '{}'", level);
    }
  }

  const std::string port = get_env_or("ZIPCAT_PORT", "");
  if (!port.empty()) {
    try {
      cfg.http_port = std::stoi(port);
    } catch (const std::exception&) {
      spdlog::warn("ignoring invalid ZIPCAT_PORT '{}'", port);
    }
  }
}

// -------- derived settings --------

spdlog::level::level_enum parseLogLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("config: unknown log level '" + name + "'");
  }
  return level;
}

InclusionPolicy makePolicy(const AppConfig& cfg) {
  InclusionPolicy p;
  p.mode = cfg.google_takeout_mode ? ScanMode::MarkerFolders : ScanMode::FullVolume;
  if (!cfg.marker_folders.empty()) p.marker_names = cfg.marker_folders;
  p.excluded_dirs.insert(cfg.excluded_directories.begin(), cfg.excluded_directories.end());
  p.hash_contents = cfg.compute_hashes;
  if (!cfg.scan_all_files) {
    for (const auto& name : cfg.categories) {
      try {
        p.categories.insert(category_from_string(name));
      } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
      }
    }
  }
  return p;
}

ScanOptions makeScanOptions(const AppConfig& cfg) {
  ScanOptions o;
  o.max_concurrency = cfg.max_workers;
  o.temp_dir = cfg.temp_dir;
  o.probe_retries = cfg.probe_retries;
  o.heartbeat_interval = std::chrono::milliseconds(cfg.progress_interval_ms);
  return o;
}

std::vector<VolumeSpec> makeVolumes(const AppConfig& cfg) {
  const auto entries = cfg.volumes.empty() ? enumerateMountedVolumes() : cfg.volumes;
  const auto policy = makePolicy(cfg);
  std::vector<VolumeSpec> out;
  out.reserve(entries.size());
  for (const auto& e : entries) out.push_back({e.label, e.root, policy});
  return out;
}

#ifndef _WIN32
static bool isMountPoint(const fs::path& p) {
  struct stat self{}, parent{};
  if (::stat(p.c_str(), &self) != 0) return false;
  if (::stat(p.parent_path().c_str(), &parent) != 0) return false;
  return self.st_dev != parent.st_dev;
}
#endif

std::vector<VolumeEntry> enumerateMountedVolumes() {
  std::vector<VolumeEntry> out;
#ifndef _WIN32
  for (const char* base : {"/mnt", "/media"}) {
    std::error_code ec;
    if (!fs::is_directory(base, ec)) continue;
    fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      spdlog::warn("cannot list {}: {}", base, ec.message());
      continue;
    }
    for (const auto& d : it) {
      std::error_code dec;
      if (!d.is_directory(dec) || d.is_symlink(dec)) continue;
      if (!isMountPoint(d.path())) continue;
      out.push_back({d.path().filename().string(), d.path().string()});
    }
  }
#endif
  if (out.empty()) out.push_back({"root", fs::path("/").root_path().string()});
  std::sort(out.begin(), out.end(), [](const VolumeEntry& a, const VolumeEntry& b) { return a.root < b.root; });
  spdlog::info("found {} volume(s)", out.size());
  return out;
}

VolumeEntry parseVolumeArg(const std::string& arg) {
  VolumeEntry v;
  const auto eq = arg.find('=');
  if (eq == std::string::npos) {
    v.root = arg;
    v.label = fs::path(arg).lexically_normal().filename().string();
  } else {
    v.label = arg.substr(0, eq);
    v.root = arg.substr(eq + 1);
  }
  if (v.root.empty()) throw std::runtime_error("--volume needs a path: '" + arg + "'");
  if (v.label.empty()) v.label = v.root;
  return v;
}

} // namespace zipcat
