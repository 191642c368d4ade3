#include "LibArchive.hpp"

#include <cctype>
#include <cerrno>
#include <clocale>
#include <string>

#include <archive.h>
#include <archive_entry.h>
#include <langinfo.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace zipcat {

namespace {

// errno libarchive reports when no format reader claims the input.
#ifdef EFTYPE
constexpr int kFileFormatErrno = EFTYPE;
#else
constexpr int kFileFormatErrno = EILSEQ;
#endif

bool codesetIsUtf8() {
  const char* cs = nl_langinfo(CODESET);
  if (!cs) return false;
  std::string s;
  for (const char* p = cs; *p; ++p) {
    if (*p != '-' && *p != '_') s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
  }
  return s == "utf8";
}

} // namespace

void ArchiveReadFree::operator()(archive* a) const {
  if (a) archive_read_free(a);
}

void throwArchiveError(archive* a, const std::string& path, const char* what) {
  const int err = archive_errno(a);
  const char* msg = archive_error_string(a);
  const std::string detail = std::string(what) + " " + path + ": " + (msg ? msg : "unknown error");

  switch (err) {
    case EACCES:
    case EPERM:
      throw CatalogError(ErrorCode::PermissionDenied, detail);
    case ENOENT:
    case EIO:
    case EAGAIN:
    case EINTR:
    case ENOSPC:
      throw CatalogError(ErrorCode::IOFailure, detail);
    default:
      throw CatalogError(ErrorCode::CorruptArchive, detail);
  }
}

ArchivePtr openZipForRead(const std::string& path) {
  ArchivePtr a(archive_read_new());
  if (!a) throw CatalogError(ErrorCode::IOFailure, "archive_read_new failed");
  archive_read_support_format_zip(a.get());

  if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
    // Format bidding happens during open: a file no reader claims is not a ZIP.
    if (archive_errno(a.get()) == kFileFormatErrno) {
      const char* msg = archive_error_string(a.get());
      throw CatalogError(ErrorCode::UnsupportedArchive,
                         "not a ZIP archive " + path + ": " + (msg ? msg : "unrecognized format"));
    }
    throwArchiveError(a.get(), path, "cannot open");
  }
  return a;
}

const char* entryPathname(archive_entry* ae) {
  if (const char* utf8 = archive_entry_pathname_utf8(ae)) return utf8;
  return archive_entry_pathname(ae);
}

bool useUtf8Locale() {
  if (std::setlocale(LC_CTYPE, "") && codesetIsUtf8()) return true;
  for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
    if (std::setlocale(LC_CTYPE, name) && codesetIsUtf8()) return true;
  }
  spdlog::warn("no UTF-8 locale available; non-ASCII entry names cannot be decoded");
  return false;
}

} // namespace zipcat
