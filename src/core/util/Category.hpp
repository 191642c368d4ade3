#pragma once
#include <set>
#include <string>

namespace zipcat {

enum class Category { Video, Image, Audio, Document, Archive, Other };

const char* to_string(Category c);
// Throws std::invalid_argument for unknown names.
Category category_from_string(const std::string& name);

// Detection by file extension only; content is never sniffed.
Category detect_category(const std::string& entryPath);

using CategorySet = std::set<Category>;

} // namespace zipcat
