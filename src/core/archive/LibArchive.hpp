#pragma once
#include <memory>
#include <string>

struct archive;
struct archive_entry;

namespace zipcat {

struct ArchiveReadFree { void operator()(archive* a) const; };
using ArchivePtr = std::unique_ptr<archive, ArchiveReadFree>;

// Opens `path` for reading as a ZIP container. Open failures are mapped onto
// the catalog error taxonomy (IOFailure, PermissionDenied,
// UnsupportedArchive, CorruptArchive).
ArchivePtr openZipForRead(const std::string& path);

// Throws CatalogError for a failed libarchive call on `a`.
[[noreturn]] void throwArchiveError(archive* a, const std::string& path, const char* what);

// Entry path as UTF-8, falling back to the locale form. Null when libarchive
// could not decode the name at all.
const char* entryPathname(archive_entry* ae);

// libarchive hands out entry names in the LC_CTYPE codeset. Switches LC_CTYPE
// to the environment's locale, or to a UTF-8 one when that is not UTF-8.
// Returns false when no UTF-8 locale is installed.
bool useUtf8Locale();

} // namespace zipcat
