#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "core/extract/Extractor.hpp"

namespace zipcat {

// Lists the candidates and reads a choice: a number (1-based) or "all".
// Anything else, or end of input, selects nothing.
class ConsolePrompt : public SelectionPrompt {
public:
  ConsolePrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

  std::vector<size_t> choose(const std::vector<CatalogMatch>& candidates) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

// "y" / "yes" (any case) confirms; everything else declines.
bool confirm(std::istream& in, std::ostream& out, const std::string& question);

} // namespace zipcat
