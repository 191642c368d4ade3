#include <gtest/gtest.h>

#include <cstdlib>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "TestSupport.hpp"
#include "core/config/Config.hpp"

using namespace zipcat;
using nlohmann::json;
using zipcat::test::TempDir;
using zipcat::test::writeFile;

namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
  ScopedEnv(const char* key, const char* value) : key_(key) { ::setenv(key, value, 1); }
  ~ScopedEnv() { ::unsetenv(key_); }

private:
  const char* key_;
};

} // namespace

TEST(Config, Defaults) {
  const auto c = parseConfig(json::object());
  EXPECT_EQ(c.max_workers, 4u);
  EXPECT_TRUE(c.google_takeout_mode);
  EXPECT_EQ(c.marker_folders, std::vector<std::string>{"GoogleTakeout"});
  EXPECT_FALSE(c.scan_all_files);
  EXPECT_EQ(c.categories, std::vector<std::string>{"video"});
  EXPECT_FALSE(c.compute_hashes);
  EXPECT_EQ(c.probe_retries, 2);
  EXPECT_EQ(c.extract_parallelism, 1u);
  EXPECT_EQ(c.progress_interval_ms, 2000);
  EXPECT_TRUE(c.volumes.empty());

  const auto p = makePolicy(c);
  EXPECT_EQ(p.mode, ScanMode::MarkerFolders);
  EXPECT_EQ(p.categories, CategorySet{Category::Video});
  EXPECT_FALSE(p.hash_contents);
}

TEST(Config, ParsesKeysAndIgnoresUnknownOnes) {
  const auto c = parseConfig(json::parse(R"({
    "database_path": "/tmp/cat.db",
    "max_workers": 0,
    "google_takeout_mode": false,
    "scan_all_files": true,
    "compute_hashes": true,
    "excluded_directories": ["node_modules"],
    "volumes": [{"label": "usb", "root": "/media/usb"}, {"root": "/mnt/backup"}],
    "colorize_output": true
  })"));
  EXPECT_EQ(c.database_path, "/tmp/cat.db");
  EXPECT_EQ(c.max_workers, 1u);
  ASSERT_EQ(c.volumes.size(), 2u);
  EXPECT_EQ(c.volumes[0].label, "usb");
  EXPECT_EQ(c.volumes[1].label, "backup");

  const auto p = makePolicy(c);
  EXPECT_EQ(p.mode, ScanMode::FullVolume);
  EXPECT_TRUE(p.categories.empty());
  EXPECT_TRUE(p.hash_contents);
  EXPECT_EQ(p.excluded_dirs.count("node_modules"), 1u);

  const auto vols = makeVolumes(c);
  ASSERT_EQ(vols.size(), 2u);
  EXPECT_EQ(vols[0].root.string(), "/media/usb");
  EXPECT_EQ(vols[0].policy.mode, ScanMode::FullVolume);
}

TEST(Config, WrongTypesAreRejected) {
  EXPECT_THROW(parseConfig(json::parse(R"({"max_workers": "many"})")), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"([1, 2])")), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({"volumes": [{"label": "x"}]})")), std::runtime_error);
}

TEST(Config, UnknownCategoryIsRejected) {
  auto c = parseConfig(json::object());
  c.categories = {"video", "holograms"};
  EXPECT_THROW(makePolicy(c), std::runtime_error);
}

TEST(Config, LoadFromFileAndEnvironment) {
  TempDir dir;
  const auto file = dir / "config.json";
  writeFile(file, R"({"database_path": "from-file.db", "http_port": 9000, "progress_interval_ms": 250})");

  ScopedEnv db("ZIPCAT_DB_PATH", "from-env.db");
  ScopedEnv port("ZIPCAT_PORT", "not-a-number");
  const auto c = loadConfig(file.string());
  EXPECT_EQ(c.database_path, "from-env.db");
  EXPECT_EQ(c.http_port, 9000);
  EXPECT_EQ(makeScanOptions(c).heartbeat_interval, std::chrono::milliseconds(250));
}

TEST(Config, MissingOrMalformedFile) {
  TempDir dir;
  EXPECT_THROW(loadConfig((dir / "nope.json").string()), std::runtime_error);
  writeFile(dir / "bad.json", "{ not json");
  EXPECT_THROW(loadConfig((dir / "bad.json").string()), std::runtime_error);
}

TEST(Config, VolumeArguments) {
  const auto a = parseVolumeArg("usb=/media/usb");
  EXPECT_EQ(a.label, "usb");
  EXPECT_EQ(a.root, "/media/usb");

  const auto b = parseVolumeArg("/mnt/backup");
  EXPECT_EQ(b.label, "backup");
  EXPECT_EQ(b.root, "/mnt/backup");

  EXPECT_THROW(parseVolumeArg("label="), std::runtime_error);
}

TEST(Config, MountEnumerationNeverComesBackEmpty) {
  EXPECT_FALSE(enumerateMountedVolumes().empty());
}

TEST(Config, LogLevels) {
  EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
  EXPECT_THROW(parseLogLevel("verbose"), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({"log_level": "loud"})")), std::runtime_error);
  EXPECT_EQ(parseConfig(json::parse(R"({"log_level": "error"})")).log_level, "error");
}

TEST(Config, InvalidLogLevelFromEnvironmentIsIgnored) {
  TempDir dir;
  const auto file = dir / "config.json";
  writeFile(file, R"({"log_level": "debug"})");

  ScopedEnv level("ZIPCAT_LOG_LEVEL", "chatty");
  EXPECT_EQ(loadConfig(file.string()).log_level, "debug");
}
