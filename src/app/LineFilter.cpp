#include "app/LineFilter.hpp"
#include "match/MatchSequence.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace wildrex::app {

LineFilter::LineFilter(const match::WildcardPattern& pattern, LineFilterSpec spec)
    : pattern_(pattern), spec_(spec) {}

void LineFilter::print_prefix(std::ostream& out, std::string_view label, std::size_t lineno) const {
  if (!label.empty()) out << label << ':';
  if (spec_.line_numbers) out << lineno << ':';
}

std::size_t LineFilter::run(std::istream& in, std::ostream& out, std::string_view label) const {
  std::size_t selected = 0;
  std::size_t lineno = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    bool hit = pattern_.is_match(line);
    if (hit == spec_.invert) continue;
    ++selected;
    if (spec_.count_only) continue;

    if (spec_.only_matching && !spec_.invert) {
      for (const auto& m : pattern_.matches(line)) {
        // '*' alone matches the empty string; nothing to print
        if (m.length == 0) continue;
        print_prefix(out, label, lineno);
        out << std::string_view(line).substr(static_cast<size_t>(m.start), static_cast<size_t>(m.length)) << '\n';
      }
    } else {
      print_prefix(out, label, lineno);
      out << line << '\n';
    }
  }
  if (spec_.count_only) {
    if (!label.empty()) out << label << ':';
    out << selected << '\n';
  }
  return selected;
}

} // namespace wildrex::app
