#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace zipcat {

// Compressed size of every entry in the central directory, read with libzip.
// Keyed by the UTF-8 entry name and also by the raw stored name when the two
// differ. Empty when libzip cannot open the file; libarchive stays the
// authority on whether an archive is readable.
std::unordered_map<std::string, int64_t> compressedSizes(const std::string& path);

} // namespace zipcat
