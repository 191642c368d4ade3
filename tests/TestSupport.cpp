#include "TestSupport.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <archive.h>
#include <archive_entry.h>
#include <gtest/gtest.h>

#include "core/archive/LibArchive.hpp"
#include "core/util/Ids.hpp"

namespace zipcat::test {

namespace fs = std::filesystem;

namespace {

// Same locale setup as the executable, so non-ASCII entry names decode.
class Utf8LocaleEnvironment : public ::testing::Environment {
public:
  void SetUp() override { useUtf8Locale(); }
};

::testing::Environment* const kUtf8Locale =
  ::testing::AddGlobalTestEnvironment(new Utf8LocaleEnvironment);

} // namespace

TempDir::TempDir()
  : path_(fs::temp_directory_path() / ("zipcat-test-" + uuid4().substr(0, 8))) {
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

void writeZip(const fs::path& path, const std::vector<ZipItem>& items) {
  if (path.has_parent_path()) fs::create_directories(path.parent_path());

  archive* a = archive_write_new();
  archive_write_set_format_zip(a);
  if (archive_write_set_options(a, "zip:hdrcharset=UTF-8") != ARCHIVE_OK ||
      archive_write_open_filename(a, path.c_str()) != ARCHIVE_OK) {
    const std::string err = archive_error_string(a) ? archive_error_string(a) : "open failed";
    archive_write_free(a);
    throw std::runtime_error("writeZip " + path.string() + ": " + err);
  }

  for (const auto& item : items) {
    archive_entry* e = archive_entry_new();
    archive_entry_set_pathname_utf8(e, item.name.c_str());
    archive_entry_set_mtime(e, 1600000000, 0);
    if (item.directory) {
      archive_entry_set_filetype(e, AE_IFDIR);
      archive_entry_set_perm(e, 0755);
      archive_entry_set_size(e, 0);
    } else {
      archive_entry_set_filetype(e, AE_IFREG);
      archive_entry_set_perm(e, 0644);
      archive_entry_set_size(e, static_cast<la_int64_t>(item.data.size()));
    }
    if (archive_write_header(a, e) != ARCHIVE_OK) {
      archive_entry_free(e);
      archive_write_free(a);
      throw std::runtime_error("writeZip header for " + item.name);
    }
    if (!item.directory && !item.data.empty()) {
      archive_write_data(a, item.data.data(), item.data.size());
    }
    archive_entry_free(e);
  }
  archive_write_close(a);
  archive_write_free(a);
}

void writeFile(const fs::path& path, const std::string& data) {
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream os(path, std::ios::binary);
  os.write(data.data(), static_cast<std::streamsize>(data.size()));
}

std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> listFiles(const fs::path& dir) {
  std::vector<std::string> out;
  if (!fs::exists(dir)) return out;
  for (const auto& e : fs::recursive_directory_iterator(dir)) {
    if (e.is_regular_file()) out.push_back(fs::relative(e.path(), dir).generic_string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace zipcat::test
