#pragma once

// Straightforward backtracking wildcard matcher, independent of the
// section compiler. Used as the oracle for randomized cross-checks.

#include <string>
#include <string_view>
#include <vector>
#include "match/WildcardPattern.hpp"

namespace refmatch {

using wildrex::match::Match;
using wildrex::match::MatchMode;

inline bool full_match(std::string_view pat, std::string_view text, char unknown, char anything) {
  size_t p = 0, t = 0;
  size_t star = std::string_view::npos, mark = 0;
  while (t < text.size()) {
    if (p < pat.size() && pat[p] == anything) { star = p++; mark = t; }
    else if (p < pat.size() && (pat[p] == unknown || pat[p] == text[t])) { ++p; ++t; }
    else if (star != std::string_view::npos) { p = star + 1; t = ++mark; }
    else return false;
  }
  while (p < pat.size() && pat[p] == anything) ++p;
  return p == pat.size();
}

// ExactMatch: whole range. Partial: leftmost start, then shortest span of the
// pattern without its outer anything tokens.
inline Match find(std::string_view pat, MatchMode mode, std::string_view text,
                  int start, int length, char unknown = '?', char anything = '*') {
  size_t b = pat.find_first_not_of(anything);
  if (b == std::string_view::npos) return {start, 0};
  size_t e = pat.find_last_not_of(anything);

  if (mode == MatchMode::ExactMatch) {
    bool ok = full_match(pat, text.substr(static_cast<size_t>(start), static_cast<size_t>(length)), unknown, anything);
    return ok ? Match{start, length} : Match{start, -1};
  }
  std::string_view core = pat.substr(b, e - b + 1);
  for (int s = start; s <= start + length; ++s) {
    for (int end = s; end <= start + length; ++end) {
      if (full_match(core, text.substr(static_cast<size_t>(s), static_cast<size_t>(end - s)), unknown, anything))
        return {s, end - s};
    }
  }
  return {start, -1};
}

inline std::vector<Match> find_all(std::string_view pat, MatchMode mode, std::string_view text,
                                   int start, int length, char unknown = '?', char anything = '*') {
  std::vector<Match> out;
  int end = start + length;
  while (true) {
    Match m = find(pat, mode, text, start, end - start, unknown, anything);
    if (!m.found()) break;
    out.push_back(m);
    if (m.length == 0 || mode == MatchMode::ExactMatch) break;
    start = m.end();
    if (start >= end) break;
  }
  return out;
}

} // namespace refmatch
