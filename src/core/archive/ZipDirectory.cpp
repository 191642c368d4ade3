#include "ZipDirectory.hpp"

#include <zip.h>
#include <spdlog/spdlog.h>

namespace zipcat {

std::unordered_map<std::string, int64_t> compressedSizes(const std::string& path) {
  std::unordered_map<std::string, int64_t> out;

  int errcode = 0;
  zip_t* za = zip_open(path.c_str(), ZIP_RDONLY, &errcode);
  if (!za) {
    zip_error_t ze;
    zip_error_init_with_code(&ze, errcode);
    spdlog::debug("libzip cannot open {}: {}", path, zip_error_strerror(&ze));
    zip_error_fini(&ze);
    return out;
  }

  const zip_int64_t n = zip_get_num_entries(za, 0);
  for (zip_int64_t i = 0; i < n; ++i) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(za, static_cast<zip_uint64_t>(i), 0, &st) != 0) continue;
    if (!(st.valid & ZIP_STAT_NAME) || !(st.valid & ZIP_STAT_COMP_SIZE)) continue;

    const auto comp = static_cast<int64_t>(st.comp_size);
    out[st.name] = comp;
    if (const char* raw = zip_get_name(za, static_cast<zip_uint64_t>(i), ZIP_FL_ENC_RAW)) {
      out.emplace(raw, comp);
    }
  }
  zip_discard(za);
  return out;
}

} // namespace zipcat
