#include "Category.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace zipcat {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

const char* to_string(Category c) {
  switch (c) {
    case Category::Video:    return "video";
    case Category::Image:    return "image";
    case Category::Audio:    return "audio";
    case Category::Document: return "document";
    case Category::Archive:  return "archive";
    case Category::Other:    return "other";
  }
  return "other";
}

Category category_from_string(const std::string& name) {
  const std::string n = lower(name);
  if (n == "video")    return Category::Video;
  if (n == "image")    return Category::Image;
  if (n == "audio")    return Category::Audio;
  if (n == "document") return Category::Document;
  if (n == "archive")  return Category::Archive;
  if (n == "other")    return Category::Other;
  throw std::invalid_argument("unknown category: " + name);
}

Category detect_category(const std::string& entryPath) {
  static const std::unordered_map<std::string, Category> kByExt = {
    {".mp4", Category::Video}, {".avi", Category::Video}, {".mov", Category::Video},
    {".mkv", Category::Video}, {".wmv", Category::Video}, {".flv", Category::Video},
    {".webm", Category::Video}, {".m4v", Category::Video}, {".3gp", Category::Video},
    {".3g2", Category::Video}, {".asf", Category::Video}, {".divx", Category::Video},
    {".f4v", Category::Video}, {".m2ts", Category::Video}, {".mts", Category::Video},
    {".ogv", Category::Video}, {".rm", Category::Video}, {".rmvb", Category::Video},
    {".vob", Category::Video}, {".xvid", Category::Video}, {".mpg", Category::Video},
    {".mpeg", Category::Video}, {".m1v", Category::Video}, {".m2v", Category::Video},

    {".jpg", Category::Image}, {".jpeg", Category::Image}, {".png", Category::Image},
    {".gif", Category::Image}, {".heic", Category::Image}, {".heif", Category::Image},
    {".webp", Category::Image}, {".bmp", Category::Image}, {".tif", Category::Image},
    {".tiff", Category::Image}, {".dng", Category::Image}, {".raw", Category::Image},

    {".mp3", Category::Audio}, {".m4a", Category::Audio}, {".aac", Category::Audio},
    {".wav", Category::Audio}, {".flac", Category::Audio}, {".ogg", Category::Audio},
    {".opus", Category::Audio}, {".wma", Category::Audio},

    {".pdf", Category::Document}, {".txt", Category::Document}, {".doc", Category::Document},
    {".docx", Category::Document}, {".xls", Category::Document}, {".xlsx", Category::Document},
    {".ppt", Category::Document}, {".pptx", Category::Document}, {".odt", Category::Document},
    {".html", Category::Document}, {".json", Category::Document}, {".csv", Category::Document},

    {".zip", Category::Archive}, {".tgz", Category::Archive}, {".gz", Category::Archive},
    {".tar", Category::Archive}, {".7z", Category::Archive}, {".rar", Category::Archive},
  };
  const std::string ext = lower(std::filesystem::path(entryPath).extension().string());
  if (auto it = kByExt.find(ext); it != kByExt.end()) return it->second;
  return Category::Other;
}

} // namespace zipcat
