#include "RecordJson.hpp"

#include <nlohmann/json.hpp>

namespace zipcat {

using nlohmann::json;

json toJson(const ArchiveRecord& a) {
  json j = {
    {"id", a.id},
    {"source_path", a.source_path},
    {"volume", a.volume},
    {"size", a.size},
    {"modified_at", a.modified_at},
    {"scanned_at", a.scanned_at}
  };
  j["content_hash"] = a.content_hash ? json(*a.content_hash) : json(nullptr);
  return j;
}

json toJson(const EntryRecord& e) {
  json j = {
    {"entry_path", e.entry_path},
    {"name", e.name},
    {"size", e.size},
    {"compressed_size", e.compressed_size},
    {"modified_at", e.modified_at},
    {"category", to_string(e.category)}
  };
  j["content_hash"] = e.content_hash ? json(*e.content_hash) : json(nullptr);
  return j;
}

json toJson(const CatalogMatch& m) {
  return {
    {"archive_path", m.archive.source_path},
    {"archive_id", m.archive.id},
    {"volume", m.archive.volume},
    {"entry_path", m.entry.entry_path},
    {"name", m.entry.name},
    {"size", m.entry.size},
    {"category", to_string(m.entry.category)}
  };
}

json toJson(const std::vector<CatalogMatch>& matches) {
  json arr = json::array();
  for (const auto& m : matches) arr.push_back(toJson(m));
  return arr;
}

json toJson(const ArchiveListing& l) {
  json j = toJson(l.archive);
  j["entry_count"] = l.entry_count;
  return j;
}

json toJson(const CatalogStats& s) {
  return {
    {"volumes", s.volumes},
    {"archives", s.archives},
    {"entries", s.entries},
    {"total_bytes", s.total_bytes}
  };
}

json toJson(const VolumeStats& v) {
  return {
    {"volume", v.volume},
    {"archives", v.archives},
    {"entries", v.entries},
    {"total_bytes", v.total_bytes}
  };
}

json toJson(const DuplicateGroup& g) {
  return {
    {"content_hash", g.content_hash},
    {"size", g.size},
    {"members", toJson(g.members)}
  };
}

} // namespace zipcat
