#include "ConsolePrompt.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <istream>
#include <numeric>
#include <ostream>

namespace zipcat {

static std::string trimLower(std::string s) {
  auto notSpace = [](unsigned char c) { return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<size_t> ConsolePrompt::choose(const std::vector<CatalogMatch>& candidates) {
  out_ << "\n" << candidates.size() << " matching files:\n";
  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& m = candidates[i];
    char size[32];
    std::snprintf(size, sizeof(size), "%.1f MB", static_cast<double>(m.entry.size) / (1024.0 * 1024.0));
    out_ << "  " << (i + 1) << ". " << m.entry.entry_path << "  (" << size << ")  ["
         << m.archive.volume << "] " << m.archive.source_path << "\n";
  }
  out_ << "Select file number to extract (1-" << candidates.size() << ", or 'all' for all): " << std::flush;

  std::string line;
  if (!std::getline(in_, line)) return {};
  line = trimLower(line);

  if (line == "all") {
    std::vector<size_t> all(candidates.size());
    std::iota(all.begin(), all.end(), size_t{0});
    return all;
  }
  const bool numeric = !line.empty() && std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isdigit(c); });
  if (numeric && line.size() < 10) {
    const size_t n = std::stoul(line);
    if (n >= 1 && n <= candidates.size()) return {n - 1};
  }
  out_ << "Invalid selection. Please choose 1-" << candidates.size() << "\n";
  return {};
}

bool confirm(std::istream& in, std::ostream& out, const std::string& question) {
  out << question << " (y/N): " << std::flush;
  std::string line;
  if (!std::getline(in, line)) return false;
  line = trimLower(line);
  return line == "y" || line == "yes";
}

} // namespace zipcat
