#pragma once
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/metadata/Records.hpp"

namespace zipcat {

nlohmann::json toJson(const ArchiveRecord& a);
nlohmann::json toJson(const EntryRecord& e);
// {archive_path, archive_id, volume, entry_path, name, size, category}
nlohmann::json toJson(const CatalogMatch& m);
nlohmann::json toJson(const std::vector<CatalogMatch>& matches);
nlohmann::json toJson(const ArchiveListing& l);
nlohmann::json toJson(const CatalogStats& s);
nlohmann::json toJson(const VolumeStats& v);
nlohmann::json toJson(const DuplicateGroup& g);

} // namespace zipcat
