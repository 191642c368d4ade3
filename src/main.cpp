// src/main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/archive/LibArchive.hpp"
#include "core/config/Config.hpp"
#include "core/extract/Extractor.hpp"
#include "core/metadata/CatalogStore.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/RecordJson.hpp"
#include "core/scan/Progress.hpp"
#include "core/scan/ScanCoordinator.hpp"
#include "services/api/HttpServer.hpp"
#include "services/cli/ConsolePrompt.hpp"

using namespace zipcat;
using nlohmann::json;

// ---------- arguments ----------

struct CliArgs {
  std::string command;
  std::string value;                       // pattern or archive id
  std::optional<std::string> config;
  std::optional<std::string> db;
  bool regex = false;
  std::optional<int64_t> min_size;
  std::optional<int64_t> max_size;
  std::vector<std::string> categories;
  std::optional<std::string> file_filter;
  std::string output_dir = ".";
  bool yes = false;
  std::vector<VolumeEntry> volumes;
  bool all_files = false;
  bool no_google_takeout = false;
  bool sequential = false;
  bool hash = false;
  std::optional<int64_t> limit;
  bool json = false;
  bool quiet = false;
};

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                 # create/upgrade the catalog schema\n"
            << "  " << argv0 << " --scan                 # index archives on all volumes\n"
            << "  " << argv0 << " --search <pattern>     # find entries by path\n"
            << "  " << argv0 << " --list-zips            # archives with their ids\n"
            << "  " << argv0 << " --stats\n"
            << "  " << argv0 << " --drives               # archives and entries per volume\n"
            << "  " << argv0 << " --list-videos          # every video entry in the catalog\n"
            << "  " << argv0 << " --duplicates           # entries sharing a content hash\n"
            << "  " << argv0 << " --extract <pattern>    # extract matching entries\n"
            << "  " << argv0 << " --extract-uuid <id>    # extract one archive's entries\n"
            << "  " << argv0 << " --extract-all          # extract the whole catalog\n"
            << "  " << argv0 << " --serve                # read-only HTTP API (ZIPCAT_PORT or 8080)\n"
            << "Options:\n"
            << "  --config <file> --db <file> --regex --min-size <bytes> --max-size <bytes>\n"
            << "  --category <name> --file-filter <text> --output-dir <dir> --yes\n"
            << "  --volume <label=path> --all-files --no-google-takeout --sequential --hash\n"
            << "  --limit <n> --json --quiet\n";
}

static int64_t to_i64(const std::string& opt, const std::string& s) {
  size_t used = 0;
  int64_t v = 0;
  try {
    v = std::stoll(s, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used == 0 || used != s.size()) throw std::invalid_argument(opt + " expects an integer, got '" + s + "'");
  return v;
}

static CliArgs parse_args(int argc, char** argv) {
  CliArgs a;
  auto need = [&](int& i) -> std::string {
    if (i + 1 >= argc) throw std::invalid_argument(std::string(argv[i]) + " needs a value");
    return argv[++i];
  };
  auto set_command = [&](const std::string& c) {
    if (!a.command.empty()) throw std::invalid_argument("only one command at a time: " + a.command + ", " + c);
    a.command = c;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--init" || arg == "--scan" || arg == "--list-zips" || arg == "--stats" ||
        arg == "--drives" || arg == "--list-videos" || arg == "--duplicates" ||
        arg == "--extract-all" || arg == "--serve") {
      set_command(arg);
    } else if (arg == "--search" || arg == "--extract" || arg == "--extract-uuid") {
      set_command(arg);
      a.value = need(i);
    } else if (arg == "--config")            a.config = need(i);
    else if (arg == "--db")                  a.db = need(i);
    else if (arg == "--regex")               a.regex = true;
    else if (arg == "--min-size")            a.min_size = to_i64(arg, need(i));
    else if (arg == "--max-size")            a.max_size = to_i64(arg, need(i));
    else if (arg == "--category")            a.categories.push_back(need(i));
    else if (arg == "--file-filter")         a.file_filter = need(i);
    else if (arg == "--output-dir")          a.output_dir = need(i);
    else if (arg == "--yes" || arg == "-y")  a.yes = true;
    else if (arg == "--volume")              a.volumes.push_back(parseVolumeArg(need(i)));
    else if (arg == "--all-files")           a.all_files = true;
    else if (arg == "--no-google-takeout")   a.no_google_takeout = true;
    else if (arg == "--sequential")          a.sequential = true;
    else if (arg == "--hash")                a.hash = true;
    else if (arg == "--limit")               a.limit = to_i64(arg, need(i));
    else if (arg == "--json")                a.json = true;
    else if (arg == "--quiet" || arg == "-q") a.quiet = true;
    else throw std::invalid_argument("unknown option: " + arg);
  }
  return a;
}

// Command-line flags win over the config file.
static void apply_args(const CliArgs& a, AppConfig& cfg) {
  if (a.db) cfg.database_path = *a.db;
  if (!a.volumes.empty()) cfg.volumes = a.volumes;
  if (a.all_files) cfg.scan_all_files = true;
  if (!a.categories.empty()) {
    cfg.categories = a.categories;
    cfg.scan_all_files = false;
  }
  if (a.no_google_takeout) cfg.google_takeout_mode = false;
  if (a.sequential) cfg.max_workers = 1;
  if (a.hash) cfg.compute_hashes = true;
  if (a.quiet) cfg.log_level = "warn";
}

static void setup_logging(const AppConfig& cfg) {
  spdlog::set_level(parseLogLevel(cfg.log_level));
  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static std::string mb(int64_t bytes) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
  return buf;
}

// ---------- interrupt ----------

static std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int) { g_interrupted.store(true); }

// Forwards Ctrl-C to the coordinator until `done` is set.
class InterruptWatch {
public:
  explicit InterruptWatch(ScanCoordinator& coord) {
    std::signal(SIGINT, on_sigint);
    thread_ = std::thread([this, &coord] {
      while (!done_.load()) {
        if (g_interrupted.load()) {
          spdlog::warn("interrupt received; finishing current archives and stopping");
          coord.cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });
  }
  ~InterruptWatch() {
    done_.store(true);
    thread_.join();
    std::signal(SIGINT, SIG_DFL);
  }

private:
  std::atomic<bool> done_{false};
  std::thread thread_;
};

// ---------- commands ----------

static int cmd_scan(const AppConfig& cfg, const CliArgs& args) {
  ensure_dirs_for(cfg.database_path);
  CatalogStore catalog(cfg.database_path);
  const auto volumes = makeVolumes(cfg);

  LogProgressReporter progress;
  ScanCoordinator coord(catalog, makeScanOptions(cfg), progress);
  ScanSummary summary;
  {
    InterruptWatch watch(coord);
    summary = coord.run(volumes);
  }

  if (args.json) {
    std::cout << toJson(summary).dump(2) << "\n";
  } else {
    std::cout << "\nScan " << to_string(summary.state) << ": " << summary.total_archives << " archives, "
              << summary.total_entries << " entries\n";
    for (const auto& v : summary.per_volume) {
      std::cout << "  " << v.volume << " (" << v.root << "): " << to_string(v.status) << ", "
                << v.archives << " archives, " << v.entries << " entries";
      if (v.error) std::cout << " - " << *v.error;
      std::cout << "\n";
      for (const auto& f : v.failures) {
        std::cout << "    " << f.code << ": " << f.path << " (" << f.reason << ")\n";
      }
    }
  }
  return summary.state == ScanState::Done ? 0 : 1;
}

static int print_matches(const std::vector<CatalogMatch>& matches, const CliArgs& args,
                         const std::string& none) {
  if (args.json) {
    std::cout << toJson(matches).dump(2) << "\n";
    return 0;
  }
  if (matches.empty()) {
    std::cout << none << "\n";
    return 0;
  }
  std::cout << "Found " << matches.size() << " files:\n";
  for (const auto& m : matches) {
    std::cout << "  " << m.entry.entry_path << "  (" << mb(m.entry.size) << ")\n"
              << "      in [" << m.archive.volume << "] " << m.archive.source_path
              << "  id " << m.archive.id << "\n";
  }
  return 0;
}

static int cmd_search(const CatalogStore& catalog, const CliArgs& args) {
  QueryFilter f;
  if (args.regex) f.regex = args.value; else f.name = args.value;
  f.min_size = args.min_size;
  f.max_size = args.max_size;
  for (const auto& c : args.categories) f.categories.insert(category_from_string(c));
  f.limit = args.limit;
  return print_matches(catalog.query(f), args, "No files found matching '" + args.value + "'");
}

static int cmd_list_videos(const CatalogStore& catalog, const CliArgs& args) {
  return print_matches(catalog.query(videoFilter(args.limit)), args, "No video files in the catalog");
}

static int cmd_list(const CatalogStore& catalog, const CliArgs& args) {
  const auto rows = catalog.listArchives(args.limit);
  if (args.json) {
    json arr = json::array();
    for (const auto& l : rows) arr.push_back(toJson(l));
    std::cout << arr.dump(2) << "\n";
    return 0;
  }
  if (rows.empty()) {
    std::cout << "No ZIP archives found in database\n";
    return 0;
  }
  std::printf("%-40s %-10s %8s  %-36s\n", "ZIP File", "Volume", "Files", "UUID");
  for (const auto& l : rows) {
    const std::string name = std::filesystem::path(l.archive.source_path).filename().string();
    std::printf("%-40.39s %-10.10s %8lld  %-36s\n", name.c_str(), l.archive.volume.c_str(),
                static_cast<long long>(l.entry_count), l.archive.id.c_str());
  }
  return 0;
}

static int cmd_stats(const CatalogStore& catalog, const CliArgs& args) {
  const auto s = catalog.stats();
  if (args.json) {
    std::cout << toJson(s).dump(2) << "\n";
    return 0;
  }
  std::cout << "Volumes:  " << s.volumes << "\n"
            << "Archives: " << s.archives << "\n"
            << "Entries:  " << s.entries << "\n"
            << "Size:     " << mb(s.total_bytes) << "\n";
  return 0;
}

static int cmd_drives(const CatalogStore& catalog, const CliArgs& args) {
  const auto rows = catalog.volumeStats();
  if (args.json) {
    json arr = json::array();
    for (const auto& v : rows) arr.push_back(toJson(v));
    std::cout << arr.dump(2) << "\n";
    return 0;
  }
  if (rows.empty()) {
    std::cout << "No volumes in the catalog. Run --scan to populate it.\n";
    return 0;
  }
  std::printf("%-20s %10s %12s %14s\n", "Volume", "Archives", "Entries", "Size (GB)");
  int64_t archives = 0, entries = 0, bytes = 0;
  for (const auto& v : rows) {
    std::printf("%-20.20s %10lld %12lld %14.2f\n", v.volume.c_str(), static_cast<long long>(v.archives),
                static_cast<long long>(v.entries), static_cast<double>(v.total_bytes) / (1024.0 * 1024.0 * 1024.0));
    archives += v.archives;
    entries += v.entries;
    bytes += v.total_bytes;
  }
  std::printf("%-20s %10lld %12lld %14.2f\n", "total", static_cast<long long>(archives),
              static_cast<long long>(entries), static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
  return 0;
}

static int cmd_duplicates(const CatalogStore& catalog, const CliArgs& args) {
  const auto groups = catalog.duplicateEntries();
  if (args.json) {
    json arr = json::array();
    for (const auto& g : groups) arr.push_back(toJson(g));
    std::cout << arr.dump(2) << "\n";
    return 0;
  }
  if (groups.empty()) {
    std::cout << "No duplicates (only entries scanned with --hash take part)\n";
    return 0;
  }
  for (const auto& g : groups) {
    std::cout << g.content_hash.substr(0, 16) << "  " << mb(g.size) << "  x" << g.members.size() << "\n";
    for (const auto& m : g.members) {
      std::cout << "    [" << m.archive.volume << "] " << m.archive.source_path << " : " << m.entry.entry_path << "\n";
    }
  }
  return 0;
}

static int cmd_extract(const CatalogStore& catalog, const AppConfig& cfg, const CliArgs& args) {
  ExtractionRequest req;
  req.destination = args.output_dir;
  req.secondary_filter = args.file_filter;
  if (args.command == "--extract") {
    req.kind = SelectorKind::NamePattern;
    req.value = args.value;
    req.regex = args.regex;
  } else if (args.command == "--extract-uuid") {
    req.kind = SelectorKind::ArchiveId;
    req.value = args.value;
  } else {
    req.kind = SelectorKind::All;
    req.confirm_all = args.yes ||
      confirm(std::cin, std::cout, "This will extract ALL files from ALL ZIP archives. Continue?");
  }

  ExtractOptions opts;
  opts.parallelism = cfg.extract_parallelism;
  opts.progress_interval = std::chrono::milliseconds(cfg.progress_interval_ms);
  LogProgressReporter progress;
  Extractor extractor(catalog, progress, opts);

  // --yes means unattended: no interactive selection.
  ConsolePrompt prompt(std::cin, std::cout);
  const auto report = extractor.run(req, args.yes ? nullptr : &prompt);

  if (args.json) {
    std::cout << toJson(report).dump(2) << "\n";
  } else {
    for (const auto& r : report.results) {
      if (r.status == ExtractionStatus::Success) {
        std::cout << "  ok     " << r.entry_path << " -> " << r.output_path.value_or("") << " ("
                  << mb(r.bytes_written) << ")\n";
      } else {
        std::cout << "  FAILED " << r.entry_path << ": " << r.error.value_or("") << "\n";
      }
    }
    std::cout << report.succeeded() << " extracted, " << report.failed() << " failed\n";
  }
  return report.failed() == 0 ? 0 : 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  useUtf8Locale();
  CliArgs args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    print_usage(argv[0]);
    return 1;
  }
  if (args.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    AppConfig cfg = loadConfig(args.config);
    apply_args(args, cfg);
    setup_logging(cfg);

    if (args.command == "--init") {
      ensure_dirs_for(cfg.database_path);
      initDatabase(cfg.database_path);
      std::cout << "DB initialized at: " << cfg.database_path << "\n";
      return 0;
    }
    if (args.command == "--scan") return cmd_scan(cfg, args);

    // Self-heal DB (idempotent)
    ensure_dirs_for(cfg.database_path);
    CatalogStore catalog(cfg.database_path);

    if (args.command == "--search")      return cmd_search(catalog, args);
    if (args.command == "--list-zips")   return cmd_list(catalog, args);
    if (args.command == "--stats")       return cmd_stats(catalog, args);
    if (args.command == "--drives")      return cmd_drives(catalog, args);
    if (args.command == "--list-videos") return cmd_list_videos(catalog, args);
    if (args.command == "--duplicates")  return cmd_duplicates(catalog, args);
    if (args.command == "--serve") {
      run_http_server(catalog, cfg.http_port, cfg.api_key);
      return 0;
    }
    return cmd_extract(catalog, cfg, args);
  } catch (const CatalogError& e) {
    std::cerr << "Fatal: " << to_string(e.code()) << ": " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
