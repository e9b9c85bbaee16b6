#pragma once

#include <cstddef>
#include <iosfwd>
#include <string_view>
#include "match/WildcardPattern.hpp"

namespace wildrex::app {

struct LineFilterSpec {
  bool only_matching{false};  // print each match instead of the whole line
  bool count_only{false};     // print only the number of matching lines
  bool invert{false};         // select non-matching lines
  bool line_numbers{false};
};

// grep-like driver: runs a compiled pattern over each line of a stream.
class LineFilter {
public:
  LineFilter(const match::WildcardPattern& pattern, LineFilterSpec spec);

  // Returns the number of selected lines. 'label' prefixes output lines
  // when non-empty (several input files).
  std::size_t run(std::istream& in, std::ostream& out, std::string_view label = {}) const;

private:
  void print_prefix(std::ostream& out, std::string_view label, std::size_t lineno) const;

  const match::WildcardPattern& pattern_;
  LineFilterSpec spec_;
};

} // namespace wildrex::app
